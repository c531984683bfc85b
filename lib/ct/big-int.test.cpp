/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <ct/common/test.hpp>
#include <ct/big-int.hpp>

using namespace cbor_turbo;

suite big_int_suite = [] {
    "big_int"_test = [] {
        "to bytes trims leading zeros"_test = [] {
            test_same(uint8_vector::from_hex("010000000000000000"), big_uint_to_bytes(uint128_t { 1 } << 64));
            test_same(uint8_vector::from_hex("FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF"), big_uint_to_bytes(uint128_max()));
            test_same(uint8_vector::from_hex("01"), big_uint_to_bytes(uint128_t { 1 }));
            expect(big_uint_to_bytes(uint128_t { 0 }).empty());
        };
        "from bytes"_test = [] {
            test_same(uint128_t { 1 } << 64, big_uint_from_bytes(uint8_vector::from_hex("010000000000000000")));
            test_same(uint128_t { 1 } << 64, big_uint_from_bytes(uint8_vector::from_hex("0000010000000000000000")));
            test_same(uint128_t { 0 }, big_uint_from_bytes(uint8_vector {}));
            test_same(uint128_max(), big_uint_from_bytes(uint8_vector::from_hex("00FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF")));
            expect(throws<cbor::value_error>([] { big_uint_from_bytes(uint8_vector::from_hex("0100000000000000000000000000000000")); }));
            expect(throws<cbor::value_error>([] { big_uint_from_bytes(uint8_vector(big_int_max_size + 1)); }));
        };
        "negative bias"_test = [] {
            test_same(uint128_t { 0 }, big_int_bias(int128_t { -1 }));
            test_same(static_cast<uint128_t>(int128_max()), big_int_bias(int128_min()));
            test_same(int128_min(), big_int_from_bias(static_cast<uint128_t>(int128_max())));
            test_same(int128_t { -1 }, big_int_from_bias(uint128_t { 0 }));
            expect(throws<cbor::value_error>([] { big_int_from_bias(uint128_max()); }));
        };
    };
};
