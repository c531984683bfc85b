/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <filesystem>
#include <fstream>
#include <ct/common/test.hpp>
#include <ct/config.hpp>

using namespace cbor_turbo;

suite config_suite = [] {
    "config"_test = [] {
        "defaults"_test = [] {
            const codec_options opts {};
            test_same(size_t { 256 }, opts.recursion_limit);
            test_same(size_t { 4096 }, opts.scratch_size);
            expect(!opts.encode_depth_limit);
            expect(codec_options::from_json(json::object {}) == opts);
        };
        "from_json"_test = [] {
            const auto j = json::parse(buffer { std::string_view { R"({"recursionLimit": 16, "scratchSize": 64, "encodeDepthLimit": 8, "comment": "x"})" } });
            const auto opts = codec_options::from_json(j.as_object());
            test_same(size_t { 16 }, opts.recursion_limit);
            test_same(size_t { 64 }, opts.scratch_size);
            expect(opts.encode_depth_limit == std::optional<size_t> { 8 });
        };
        "null encode limit"_test = [] {
            const auto j = json::parse(buffer { std::string_view { R"({"encodeDepthLimit": null})" } });
            expect(!codec_options::from_json(j.as_object()).encode_depth_limit);
        };
        "wrong types"_test = [] {
            const auto j1 = json::parse(buffer { std::string_view { R"({"recursionLimit": "deep"})" } });
            expect(throws<error>([&] { codec_options::from_json(j1.as_object()); }));
            const auto j2 = json::parse(buffer { std::string_view { R"({"scratchSize": -1})" } });
            expect(throws<error>([&] { codec_options::from_json(j2.as_object()); }));
        };
        "from_file"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "ct-config-test.json").string();
            {
                std::ofstream os { path };
                os << R"({"recursionLimit": 32})";
            }
            const auto opts = codec_options::from_file(path);
            std::filesystem::remove(path);
            test_same(size_t { 32 }, opts.recursion_limit);
            test_same(size_t { 4096 }, opts.scratch_size);
            expect(throws<error>([] { codec_options::from_file("/nonexistent/ct-config.json"); }));
        };
    };
};
