/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <ct/common/test.hpp>
#include <ct/cbor/decoder.hpp>

using namespace cbor_turbo;
using namespace cbor_turbo::cbor;

namespace {
    header pull_one(const std::string_view hex)
    {
        const auto data = uint8_vector::from_hex(hex);
        buffer_source src { data };
        decoder dec { src };
        return dec.pull();
    }

    struct failing_source: source {
        void read(write_buffer) override
        {
            throw std::runtime_error("connection reset");
        }
    };
}

suite cbor_decoder_suite = [] {
    "cbor::decoder"_test = [] {
        "integers"_test = [] {
            expect(pull_one("00") == header { positive_header { 0 } });
            expect(pull_one("17") == header { positive_header { 23 } });
            expect(pull_one("1818") == header { positive_header { 24 } });
            expect(pull_one("190240") == header { positive_header { 576 } });
            expect(pull_one("1a00051000") == header { positive_header { 331776 } });
            expect(pull_one("1BFFFFFFFFFFFFFFFF") == header { positive_header { 0xFFFFFFFFFFFFFFFFULL } });
            expect(pull_one("20") == header { negative_header { 0 } });
            expect(pull_one("3903E7") == header { negative_header { 999 } });
        };
        "lengths"_test = [] {
            expect(pull_one("45") == header { bytes_header { 5 } });
            expect(pull_one("5F") == header { bytes_header {} });
            expect(pull_one("6161") == header { text_header { 1 } });
            expect(pull_one("7F") == header { text_header {} });
            expect(pull_one("83") == header { array_header { 3 } });
            expect(pull_one("9F") == header { array_header {} });
            expect(pull_one("A1") == header { map_header { 1 } });
            expect(pull_one("BF") == header { map_header {} });
            expect(pull_one("D82A") == header { tag_header { 42 } });
        };
        "simple and floats"_test = [] {
            expect(pull_one("F4") == header { simple_header { 20 } });
            expect(pull_one("F5") == header { simple_header { 21 } });
            expect(pull_one("F6") == header { simple_header { 22 } });
            expect(pull_one("F7") == header { simple_header { 23 } });
            expect(pull_one("F820") == header { simple_header { 32 } });
            expect(pull_one("FF") == header { break_header {} });
            expect(pull_one("F93E00") == header { float_header { 1.5 } });
            expect(pull_one("F90001") == header { float_header { 5.960464477539063e-8 } });
            expect(pull_one("F9FC00") == header { float_header { -std::numeric_limits<double>::infinity() } });
            expect(pull_one("FA47C35000") == header { float_header { 100000.0 } });
            expect(pull_one("FB3FF199999999999A") == header { float_header { 1.1 } });
            const auto nan_h = pull_one("F97E00");
            expect(std::holds_alternative<float_header>(nan_h));
            expect(std::isnan(std::get<float_header>(nan_h).val));
        };
        "syntax errors"_test = [] {
            expect(throws<syntax_error>([] { pull_one("1C"); }));
            expect(throws<syntax_error>([] { pull_one("3D"); }));
            expect(throws<syntax_error>([] { pull_one("FE"); }));
            expect(throws<syntax_error>([] { pull_one("1F"); }));
            expect(throws<syntax_error>([] { pull_one("3F"); }));
            expect(throws<syntax_error>([] { pull_one("DF"); }));
            expect(throws<syntax_error>([] { pull_one("F818"); }));
            expect(throws<syntax_error>([] { pull_one("F81F"); }));
        };
        "syntax error offset"_test = [] {
            const auto data = uint8_vector::from_hex("0001FE");
            buffer_source src { data };
            decoder dec { src };
            dec.pull();
            dec.pull();
            try {
                dec.pull();
                expect(false);
            } catch (const syntax_error &ex) {
                test_same(size_t { 2 }, ex.offset());
            }
        };
        "incomplete input"_test = [] {
            expect(throws<incomplete_error>([] { pull_one(""); }));
            expect(throws<incomplete_error>([] { pull_one("19FF"); }));
            expect(throws<io_error>([] { pull_one("1B0000"); }));
        };
        "push back"_test = [] {
            const auto data = uint8_vector::from_hex("0102");
            buffer_source src { data };
            decoder dec { src };
            const auto h = dec.pull();
            dec.push(h);
            expect(throws([&] { dec.push(h); }));
            expect(dec.pull() == header { positive_header { 1 } });
            expect(dec.pull() == header { positive_header { 2 } });
            test_same(size_t { 2 }, dec.offset());
        };
        "read_exact and borrow"_test = [] {
            const auto data = uint8_vector::from_hex("4548656c6c6f4101");
            buffer_source src { data };
            decoder dec { src };
            expect(dec.pull() == header { bytes_header { 5 } });
            uint8_vector out(5);
            dec.read_exact(out);
            test_same(std::string_view { "Hello" }, out.str());
            expect(dec.pull() == header { bytes_header { 1 } });
            const auto view = dec.borrow(1);
            expect(view.has_value());
            expect(view->data() == data.data() + 7);
            test_same(size_t { 8 }, dec.offset());
        };
        "stream source"_test = [] {
            std::istringstream is { std::string { "\x83\x01\x02\x03", 4 } };
            stream_source src { is };
            decoder dec { src };
            expect(dec.pull() == header { array_header { 3 } });
            expect(!dec.borrow(1).has_value());
            expect(dec.pull() == header { positive_header { 1 } });
            expect(dec.pull() == header { positive_header { 2 } });
            expect(dec.pull() == header { positive_header { 3 } });
            expect(throws<incomplete_error>([&] { dec.pull(); }));
        };
        "skip"_test = [] {
            const auto data = uint8_vector::from_hex("9F01A16161C24101FF7F616161FF0A");
            buffer_source src { data };
            decoder dec { src };
            dec.skip();
            dec.skip();
            expect(dec.pull() == header { positive_header { 10 } });
        };
        "foreign source errors become io errors"_test = [] {
            failing_source src {};
            decoder dec { src };
            expect(throws<io_error>([&] { dec.pull(); }));
        };
    };
};
