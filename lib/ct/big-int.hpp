/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_BIG_INT_HPP
#define CBOR_TURBO_BIG_INT_HPP

#include <algorithm>
#include <sstream>
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <ct/common/bytes.hpp>
#include <ct/common/format.hpp>
#include <ct/cbor/error.hpp>

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

namespace cbor_turbo {
    using boost::multiprecision::uint128_t;
    using boost::multiprecision::int128_t;

    static constexpr size_t big_int_max_size = 8192;

    // two's complement bounds, boost's int128_t itself is signed-magnitude
    inline const int128_t &int128_max()
    {
        static const int128_t val = (int128_t { 1 } << 127) - 1;
        return val;
    }

    inline const int128_t &int128_min()
    {
        static const int128_t val = -(int128_t { 1 } << 127);
        return val;
    }

    inline const uint128_t &uint128_max()
    {
        static const uint128_t val = std::numeric_limits<uint128_t>::max();
        return val;
    }

    // big-endian magnitude without leading zero bytes
    inline uint8_vector big_uint_to_bytes(const uint128_t &val)
    {
        uint8_vector buf {};
        auto val_copy = val;
        while (val_copy) {
            buf.emplace_back(static_cast<uint8_t>(val_copy & 0xFF));
            val_copy >>= 8;
        }
        std::reverse(buf.begin(), buf.end());
        return buf;
    }

    inline uint128_t big_uint_from_bytes(const buffer data)
    {
        if (data.size() > big_int_max_size)
            throw cbor::value_error(fmt::format("big ints larger than {} bytes are not supported but got: {}!", big_int_max_size, data.size()));
        size_t start = 0;
        while (start < data.size() && data[start] == 0)
            ++start;
        if (data.size() - start > sizeof(uint64_t) * 2)
            throw cbor::value_error(fmt::format("integer too large: a big int of {} significant bytes", data.size() - start));
        uint128_t val = 0;
        for (size_t i = start; i < data.size(); ++i) {
            val <<= 8;
            val |= data[i];
        }
        return val;
    }

    // the negative bias of a value: -1 - val
    inline uint128_t big_int_bias(const int128_t &val)
    {
        return static_cast<uint128_t>(-(val + 1));
    }

    inline int128_t big_int_from_bias(const uint128_t &bias)
    {
        if (bias > static_cast<uint128_t>(int128_max()))
            throw cbor::value_error(fmt::format("integer too large: -1 - {} does not fit into 128 bits", bias));
        return -static_cast<int128_t>(bias) - 1;
    }
}

#endif // !CBOR_TURBO_BIG_INT_HPP
