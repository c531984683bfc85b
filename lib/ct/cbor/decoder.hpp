/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_CBOR_DECODER_HPP
#define CBOR_TURBO_CBOR_DECODER_HPP

#include <optional>
#include <ct/common/bytes.hpp>
#include <ct/cbor/io.hpp>
#include <ct/cbor/types.hpp>

namespace cbor_turbo::cbor {
    struct decoder {
        explicit decoder(source &src):
            _src { src }
        {
        }

        header pull();
        // returns a header to the stream; only one header can be pending at a time
        void push(const header &h);
        void read_exact(write_buffer out);
        std::optional<buffer> borrow(size_t sz);
        // skips the next complete data item including nested items
        void skip();

        size_t offset() const noexcept
        {
            return _offset;
        }

        // the offset of the first byte of the most recently pulled header
        size_t header_offset() const noexcept
        {
            return _header_offset;
        }
    private:
        source &_src;
        std::optional<header> _pushed {};
        size_t _offset = 0;
        size_t _header_offset = 0;

        uint64_t _read_uint(size_t sz);
        void _read(write_buffer out);
        void _skip_bytes(uint64_t sz);
    };
}

#endif // !CBOR_TURBO_CBOR_DECODER_HPP
