/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_CONFIG_HPP
#define CBOR_TURBO_CONFIG_HPP

#include <optional>
#include <string>
#include <ct/json.hpp>

namespace cbor_turbo {
    struct codec_options {
        static constexpr size_t default_recursion_limit = 256;
        static constexpr size_t default_scratch_size = 4096;

        // nesting depth allowed when decoding
        size_t recursion_limit = default_recursion_limit;
        // the size of the buffer lent to a deserializer for string and byte content
        size_t scratch_size = default_scratch_size;
        // encoding depth is not checked when unset
        std::optional<size_t> encode_depth_limit {};

        // reads recursionLimit, scratchSize and encodeDepthLimit, other keys are ignored
        static codec_options from_json(const json::object &j);
        static codec_options from_file(const std::string &path);
        // the process-wide defaults, loaded from the file named by CT_CONFIG when it is set
        static const codec_options &get();

        bool operator==(const codec_options &) const =default;
    };
}

#endif // !CBOR_TURBO_CONFIG_HPP
