/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <sstream>
#include <ct/common/test.hpp>
#include <ct/cbor/io.hpp>

using namespace cbor_turbo;
using namespace cbor_turbo::cbor;

suite cbor_io_suite = [] {
    "cbor::io"_test = [] {
        "vector_sink"_test = [] {
            uint8_vector out {};
            vector_sink s { out };
            s.write(uint8_vector::from_hex("0102"));
            s.write(uint8_vector::from_hex("03"));
            s.flush();
            test_same(uint8_vector::from_hex("010203"), out);
        };
        "buffer_source"_test = [] {
            const auto data = uint8_vector::from_hex("0102030405");
            buffer_source src { data };
            uint8_vector out(2);
            src.read(out);
            test_same(uint8_vector::from_hex("0102"), out);
            const auto view = src.borrow(2);
            expect(view.has_value());
            expect(view->data() == data.data() + 2);
            test_same(size_t { 4 }, src.position());
            test_same(size_t { 1 }, src.remaining());
            expect(throws<incomplete_error>([&] { src.borrow(2); }));
            try {
                src.borrow(3);
                expect(false) << "an incomplete borrow must throw";
            } catch (const incomplete_error &ex) {
                test_same(size_t { 4 }, ex.offset());
                test_same(size_t { 2 }, ex.needed());
            }
            expect(throws<incomplete_error>([&] {
                uint8_vector big(3);
                src.read(big);
            }));
        };
        "stream_source"_test = [] {
            std::istringstream is { std::string { "\x01\x02\x03", 3 } };
            stream_source src { is };
            uint8_vector out(2);
            src.read(out);
            test_same(uint8_vector::from_hex("0102"), out);
            expect(!src.borrow(1).has_value());
            expect(throws<incomplete_error>([&] { src.read(out); }));
        };
        "stream_sink"_test = [] {
            std::ostringstream os {};
            stream_sink s { os };
            s.write(uint8_vector::from_hex("4142"));
            s.flush();
            test_same(std::string { "AB" }, os.str());
        };
        "stream_sink failure"_test = [] {
            std::ostringstream os {};
            os.setstate(std::ios::badbit);
            stream_sink s { os };
            expect(throws<io_error>([&] { s.write(uint8_vector::from_hex("41")); }));
        };
    };
};
