/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <sstream>
#include <ct/common/test.hpp>
#include <ct/serde.hpp>

using namespace cbor_turbo;
using namespace cbor_turbo::serde;

namespace {
    value u(const uint64_t x)
    {
        return value { x };
    }

    value t(const std::string_view s)
    {
        return value { std::string { s } };
    }

    shape message_shape()
    {
        return shape::record("Message", {
            { "id", shape::u32() },
            { "kind", shape::enumeration("Kind", {
                shape::unit_variant("Ping"),
                shape::newtype_variant("Data", shape::bytes()),
                shape::struct_variant("Move", { { "dx", shape::i16() }, { "dy", shape::i16() } })
            }) },
            { "tags", shape::seq(shape::text()) },
            { "attrs", shape::map(shape::text(), shape::option(shape::u64())) },
            { "stamp", shape::tag_accepted(1, shape::u64()) },
            { "note", shape::option(shape::text()) }
        });
    }

    value message()
    {
        return record { "Message", {
            field { "id", u(7) },
            field { "kind", value { struct_variant { "Kind", 2, "Move", { field { "dx", value { int64_t { -3 } } }, field { "dy", value { int64_t { 4 } } } } } } },
            field { "tags", value { seq { { t("a"), t("b") } } } },
            field { "attrs", value { map { { map_entry { t("x"), u(1) }, map_entry { t("y"), value { none_t {} } } } } } },
            field { "stamp", value { tagged { 1, u(1700000000) } } },
            field { "note", value { none_t {} } }
        } };
    }
}

suite serde_suite = [] {
    "serde"_test = [] {
        "round trip of a record"_test = [] {
            const auto v = message();
            const auto bytes = encode(v);
            test_same(v, decode(bytes, message_shape()));
        };
        "round trip through streams"_test = [] {
            const auto v = message();
            std::ostringstream os {};
            cbor::stream_sink s { os };
            encode_to_sink(v, s);
            std::istringstream is { os.str() };
            cbor::stream_source src { is };
            test_same(v, decode(src, message_shape()));
        };
        "round trip of enum variants"_test = [] {
            const auto s = shape::enumeration("Kind", {
                shape::unit_variant("Ping"),
                shape::newtype_variant("Data", shape::bytes()),
                shape::tuple_variant("Pair", { shape::u8(), shape::text() })
            });
            for (const auto &v: {
                    value { unit_variant { "Kind", 0, "Ping" } },
                    value { newtype_variant { "Kind", 1, "Data", value { uint8_vector::from_hex("DEADBEEF") } } },
                    value { tuple_variant { "Kind", 2, "Pair", { u(1), t("one") } } } }) {
                test_same(v, decode(encode(v), s));
            }
        };
        "round trip of tagged values"_test = [] {
            const auto v = tag::make_tagged(32, t("https://example.com"));
            const auto bytes = encode(v);
            test_same(uint8_vector::from_hex("D820"), uint8_vector { buffer { bytes }.subbuf(0, 2) });
            test_same(value { tagged { 32, t("https://example.com") } }, decode(bytes, shape::tag_required(32, shape::text())));
            test_same(value { tagged { {}, u(5) } }, decode(encode(tag::make_untagged(u(5))), shape::tag_accepted(32, shape::u8())));
        };
        "round trip of wide integers"_test = [] {
            const uint128_t big { (uint128_t { 1 } << 100) + 12345 };
            test_same(value { big }, decode(encode(value { big }), shape::u128()));
            test_same(value { big }, decode(encode(value { big }), shape::any()));
            const int128_t neg { -static_cast<int128_t>(big) };
            test_same(value { neg }, decode(encode(value { neg }), shape::i128()));
            test_same(value { int128_min() }, decode(encode(value { int128_min() }), shape::i128()));
        };
        "round trip of indefinite collections"_test = [] {
            const value v { seq { { value { map { { map_entry { t("k"), u(1) } }, false } } }, false } };
            const auto bytes = encode(v);
            test_same(uint8_vector::from_hex("9FBF616B01FFFF"), bytes);
            test_same(v, decode(bytes, shape::any()));
        };
        "options control the limits"_test = [] {
            codec_options opts {};
            opts.encode_depth_limit = 1;
            const value nested { seq { { value { seq {} } } } };
            expect(throws<cbor::recursion_limit_error>([&] { encode(nested, opts); }));
            opts.encode_depth_limit.reset();
            opts.recursion_limit = 1;
            const auto bytes = encode(nested, opts);
            expect(throws<cbor::recursion_limit_error>([&] { decode(bytes, shape::any(), opts); }));
            opts.recursion_limit = 2;
            test_same(nested, decode(bytes, shape::any(), opts));
        };
        "value accessors"_test = [] {
            const auto v = message();
            test_same(std::string_view { "record" }, std::string_view { v.type_name() });
            test_same(size_t { 6 }, v.as<record>().fields.size());
            expect(throws<error>([&] { v.as<seq>(); }));
            test_same(std::string { "[_ 1, \"a\"]" }, value { seq { { u(1), t("a") }, false } }.to_string());
            test_same(std::string { "Kind::Ping" }, value { unit_variant { "Kind", 0, "Ping" } }.to_string());
            test_same(std::string { "P {x: 1}" }, value { record { "P", { field { "x", u(1) } } } }.to_string());
            test_same(std::string { "42(none)" }, value { tagged { 42, value { none_t {} } } }.to_string());
        };
        "shapes"_test = [] {
            const auto s = message_shape();
            test_same(size_t { 6 }, s.children.size());
            test_same(std::string { "kind" }, s.names.at(1));
            test_same(shape_kind::enumeration, s.child(1).kind);
            expect(throws<error>([&] { s.child(6); }));
            expect(throws<error>([] { decode(uint8_vector::from_hex("00"), shape::unit_variant("A")); }));
        };
    };
};
