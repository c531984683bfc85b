/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_CBOR_HALF_HPP
#define CBOR_TURBO_CBOR_HALF_HPP

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>

namespace cbor_turbo::cbor::half {
    static constexpr uint16_t canonical_nan = 0x7E00;

    inline double to_double(const uint16_t h)
    {
        const int exp = (h >> 10) & 0x1F;
        const int mant = h & 0x3FF;
        double val;
        if (exp == 0)
            val = std::ldexp(static_cast<double>(mant), -24);
        else if (exp == 0x1F)
            val = mant ? std::numeric_limits<double>::quiet_NaN() : std::numeric_limits<double>::infinity();
        else
            val = std::ldexp(static_cast<double>(mant + 0x400), exp - 25);
        return h & 0x8000 ? -val : val;
    }

    // the half-precision bits of val when the conversion loses nothing
    inline std::optional<uint16_t> from_double(const double val)
    {
        if (std::isfinite(val) && std::fabs(val) > std::numeric_limits<float>::max())
            return {};
        const auto f = static_cast<float>(val);
        if (static_cast<double>(f) != val)
            return {};
        uint32_t bits;
        memcpy(&bits, &f, sizeof(bits));
        const uint16_t sign = (bits >> 16) & 0x8000;
        const int exp = (bits >> 23) & 0xFF;
        const uint32_t mant = bits & 0x7FFFFF;
        if (exp == 0xFF)
            return static_cast<uint16_t>(sign | 0x7C00);
        if (exp == 0)
            return mant ? std::optional<uint16_t> {} : std::optional<uint16_t> { sign };
        const int e = exp - 127;
        if (e > 15)
            return {};
        if (e >= -14) {
            if (mant & 0x1FFF)
                return {};
            return static_cast<uint16_t>(sign | ((e + 15) << 10) | (mant >> 13));
        }
        if (e < -24)
            return {};
        const uint32_t full = mant | 0x800000;
        const int shift = -(e + 1);
        if (full & ((1U << shift) - 1))
            return {};
        return static_cast<uint16_t>(sign | (full >> shift));
    }
}

#endif // !CBOR_TURBO_CBOR_HALF_HPP
