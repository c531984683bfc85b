/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <ct/common/test.hpp>
#include <ct/serde/serializer.hpp>
#include <ct/serde/tag.hpp>

using namespace cbor_turbo;
using namespace cbor_turbo::serde;

namespace {
    uint8_vector enc(const value &v, const std::optional<size_t> depth_limit={})
    {
        uint8_vector out {};
        cbor::vector_sink s { out };
        serializer ser { s, depth_limit };
        ser.write(v);
        return out;
    }

    value u(const uint64_t x)
    {
        return value { x };
    }

    value i(const int64_t x)
    {
        return value { x };
    }

    value t(const std::string_view s)
    {
        return value { std::string { s } };
    }

    const uint128_t two_64 { uint128_t { 1 } << 64 };
}

suite serde_serializer_suite = [] {
    "serde::serializer"_test = [] {
        "minimal integer widths"_test = [] {
            test_same(uint8_vector::from_hex("00"), enc(u(0)));
            test_same(uint8_vector::from_hex("01"), enc(u(1)));
            test_same(uint8_vector::from_hex("1818"), enc(u(24)));
            test_same(uint8_vector::from_hex("190240"), enc(u(576)));
            test_same(uint8_vector::from_hex("193600"), enc(u(13824)));
            test_same(uint8_vector::from_hex("1a00051000"), enc(u(331776)));
            test_same(uint8_vector::from_hex("1a00798000"), enc(u(7962624)));
            test_same(uint8_vector::from_hex("05"), enc(i(5)));
            test_same(uint8_vector::from_hex("20"), enc(i(-1)));
            test_same(uint8_vector::from_hex("3901F3"), enc(i(-500)));
            test_same(uint8_vector::from_hex("3B7FFFFFFFFFFFFFFF"), enc(i(std::numeric_limits<int64_t>::min())));
        };
        "128-bit integers"_test = [] {
            test_same(uint8_vector::from_hex("05"), enc(value { uint128_t { 5 } }));
            test_same(uint8_vector::from_hex("1BFFFFFFFFFFFFFFFF"), enc(value { uint128_t { std::numeric_limits<uint64_t>::max() } }));
            test_same(uint8_vector::from_hex("C249010000000000000000"), enc(value { two_64 }));
            test_same(uint8_vector::from_hex("C250FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF"), enc(value { uint128_max() }));
            test_same(uint8_vector::from_hex("29"), enc(value { int128_t { -10 } }));
            test_same(uint8_vector::from_hex("3BFFFFFFFFFFFFFFFF"), enc(value { int128_t { -static_cast<int128_t>(two_64) } }));
            test_same(uint8_vector::from_hex("C349010000000000000000"), enc(value { int128_t { -static_cast<int128_t>(two_64) - 1 } }));
            test_same(uint8_vector::from_hex("C3507FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF"), enc(value { int128_min() }));
            test_same(uint8_vector::from_hex("C2507FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF"), enc(value { int128_max() }));
        };
        "scalars"_test = [] {
            test_same(uint8_vector::from_hex("F5"), enc(value { true }));
            test_same(uint8_vector::from_hex("F4"), enc(value { false }));
            test_same(uint8_vector::from_hex("F93E00"), enc(value { 1.5 }));
            test_same(uint8_vector::from_hex("6161"), enc(value { U'a' }));
            test_same(uint8_vector::from_hex("62C3A9"), enc(value { char32_t { 0xE9 } }));
            test_same(uint8_vector::from_hex("6449455446"), enc(t("IETF")));
            test_same(uint8_vector::from_hex("43010203"), enc(value { uint8_vector::from_hex("010203") }));
            test_same(uint8_vector::from_hex("F6"), enc(value { none_t {} }));
            test_same(uint8_vector::from_hex("F6"), enc(value { unit_t {} }));
            test_same(uint8_vector::from_hex("F6"), enc(value { unit_struct { "Empty" } }));
            expect(throws<cbor::value_error>([] { enc(value { char32_t { 0xD800 } }); }));
        };
        "enum variants"_test = [] {
            test_same(uint8_vector::from_hex("6141"), enc(value { unit_variant { "E", 0, "A" } }));
            test_same(uint8_vector::from_hex("05"), enc(value { newtype_struct { "N", u(5) } }));
            test_same(uint8_vector::from_hex("A1614205"), enc(value { newtype_variant { "E", 1, "B", u(5) } }));
            test_same(uint8_vector::from_hex("A16143820102"), enc(value { tuple_variant { "E", 2, "C", { u(1), u(2) } } }));
            test_same(uint8_vector::from_hex("A16144A1617801"), enc(value { struct_variant { "E", 3, "D", { field { "x", u(1) } } } }));
        };
        "collections"_test = [] {
            test_same(uint8_vector::from_hex("83010203"), enc(value { seq { { u(1), u(2), u(3) } } }));
            test_same(uint8_vector::from_hex("9F010203FF"), enc(value { seq { { u(1), u(2), u(3) }, false } }));
            test_same(uint8_vector::from_hex("9F9FFFFF"), enc(value { seq { { value { seq { {}, false } } }, false } }));
            test_same(uint8_vector::from_hex("80"), enc(value { seq {} }));
            test_same(uint8_vector::from_hex("82016161"), enc(value { tuple { { u(1), t("a") } } }));
            test_same(uint8_vector::from_hex("820102"), enc(value { tuple_struct { "Pair", { u(1), u(2) } } }));
            test_same(uint8_vector::from_hex("A10102"), enc(value { map { { map_entry { u(1), u(2) } } } }));
            test_same(uint8_vector::from_hex("BF0102FF"), enc(value { map { { map_entry { u(1), u(2) } }, false } }));
        };
        "record fields keep their declaration order"_test = [] {
            const value v { record { "Point", { field { "y", i(-1) }, field { "x", u(1) } } } };
            test_same(uint8_vector::from_hex("A26179206178" "01"), enc(v));
        };
        "tag convention"_test = [] {
            test_same(uint8_vector::from_hex("D82A6178"), enc(tag::make_tagged(42, t("x"))));
            test_same(uint8_vector::from_hex("05"), enc(tag::make_untagged(u(5))));
            test_same(uint8_vector::from_hex("D82A6178"), enc(value { tagged { 42, t("x") } }));
            test_same(uint8_vector::from_hex("6178"), enc(value { tagged { {}, t("x") } }));
            const value via_u128 { tuple_variant { std::string { tag::type_name }, 0, std::string { tag::tagged_name }, { value { uint128_t { 42 } }, u(0) } } };
            test_same(uint8_vector::from_hex("D82A00"), enc(via_u128));
            const value via_newtype { tuple_variant { std::string { tag::type_name }, 0, std::string { tag::tagged_name }, { value { newtype_struct { "Tag", u(42) } }, u(0) } } };
            test_same(uint8_vector::from_hex("D82A00"), enc(via_newtype));
            // sentinel variant names under a different type name are regular variants
            test_same(uint8_vector::from_hex("A16A40405441474745444040820100"),
                enc(value { tuple_variant { "Other", 0, std::string { tag::tagged_name }, { u(1), u(0) } } }));
        };
        "tag convention errors"_test = [] {
            const value text_tag { tuple_variant { std::string { tag::type_name }, 0, std::string { tag::tagged_name }, { t("x"), u(0) } } };
            expect(throws<cbor::value_error>([&] { enc(text_tag); }));
            const value big_tag { tuple_variant { std::string { tag::type_name }, 0, std::string { tag::tagged_name }, { value { two_64 }, u(0) } } };
            expect(throws<cbor::value_error>([&] { enc(big_tag); }));
            const value three { tuple_variant { std::string { tag::type_name }, 0, std::string { tag::tagged_name }, { u(1), u(2), u(3) } } };
            expect(throws<cbor::value_error>([&] { enc(three); }));
            const value one { tuple_variant { std::string { tag::type_name }, 0, std::string { tag::tagged_name }, { u(1) } } };
            expect(throws<cbor::value_error>([&] { enc(one); }));
        };
        "tag extraction"_test = [] {
            test_same(uint64_t { 7 }, tag::extract(u(7)));
            test_same(uint64_t { 7 }, tag::extract(value { uint128_t { 7 } }));
            test_same(uint64_t { 7 }, tag::extract(value { newtype_struct { "T", u(7) } }));
            expect(throws<cbor::value_error>([] { tag::extract(i(7)); }));
            expect(throws<cbor::value_error>([] { tag::extract(value { true }); }));
        };
        "collection state"_test = [] {
            uint8_vector out {};
            cbor::vector_sink s { out };
            serializer ser { s };
            ser.encoder().array();
            collection_state st { ser, true, false };
            st.element(u(1));
            st.element(u(2));
            st.end();
            ser.encoder().map(1);
            collection_state definite { ser, false, false };
            definite.entry(u(1), u(2));
            definite.end();
            test_same(uint8_vector::from_hex("9F0102FFA10102"), out);
        };
        "encode depth limit"_test = [] {
            const value nested { seq { { value { seq {} } } } };
            test_same(uint8_vector::from_hex("8180"), enc(nested, 2));
            expect(throws<cbor::recursion_limit_error>([&] { enc(nested, 1); }));
            test_same(uint8_vector::from_hex("8180"), enc(nested));
            expect(throws<cbor::recursion_limit_error>([] { enc(value { tagged { 1, value { seq {} } } }, 1); }));
        };
        "encode depth limit covers transparent wrappers"_test = [] {
            value v = u(5);
            for (size_t n = 0; n < 50; ++n)
                v = value { newtype_struct { "N", v } };
            for (size_t n = 0; n < 50; ++n)
                v = value { tagged { {}, v } };
            expect(throws<cbor::recursion_limit_error>([&] { enc(v, 1); }));
            expect(throws<cbor::recursion_limit_error>([&] { enc(v, 99); }));
            test_same(uint8_vector::from_hex("05"), enc(v, 100));
            expect(throws<cbor::recursion_limit_error>([] { enc(value { newtype_struct { "N", value { seq {} } } }, 1); }));
            expect(throws<cbor::recursion_limit_error>([] { enc(tag::make_untagged(value { seq {} }), 1); }));
        };
        "is not human readable"_test = [] {
            expect(!serializer::is_human_readable());
        };
    };
};
