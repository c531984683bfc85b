/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdlib>
#include <ct/config.hpp>
#include <ct/logger.hpp>

namespace cbor_turbo {
    static size_t config_size(const json::object &j, const std::string_view name, const size_t def)
    {
        const auto it = j.find(name);
        if (it == j.end())
            return def;
        const auto &v = it->value();
        if (v.is_uint64())
            return v.get_uint64();
        if (v.is_int64() && v.get_int64() >= 0)
            return static_cast<size_t>(v.get_int64());
        throw error(fmt::format("configuration element {} must be a non-negative integer but got: {}", name, json::serialize(v)));
    }

    codec_options codec_options::from_json(const json::object &j)
    {
        codec_options opts {};
        opts.recursion_limit = config_size(j, "recursionLimit", default_recursion_limit);
        opts.scratch_size = config_size(j, "scratchSize", default_scratch_size);
        if (const auto it = j.find("encodeDepthLimit"); it != j.end() && !it->value().is_null())
            opts.encode_depth_limit = config_size(j, "encodeDepthLimit", 0);
        return opts;
    }

    codec_options codec_options::from_file(const std::string &path)
    {
        const auto j = json::load(path);
        if (!j.is_object())
            throw error(fmt::format("configuration file {} must contain a JSON object", path));
        return from_json(j.get_object());
    }

    const codec_options &codec_options::get()
    {
        static const codec_options opts = [] {
            if (const char *path = std::getenv("CT_CONFIG"); path) {
                auto o = from_file(path);
                logger::info("codec options loaded from {}: recursion limit: {} scratch size: {} encode depth limit: {}",
                    path, o.recursion_limit, o.scratch_size, o.encode_depth_limit);
                return o;
            }
            return codec_options {};
        }();
        return opts;
    }
}
