/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_NARROW_CAST_HPP
#define CBOR_TURBO_NARROW_CAST_HPP

#include <limits>
#include <typeinfo>
#include <utility>
#include <ct/cbor/error.hpp>

namespace cbor_turbo {
    template<typename TO, typename FROM>
    constexpr TO narrow_cast(const FROM from)
    {
        if (std::cmp_greater(from, std::numeric_limits<TO>::max())) [[unlikely]]
            throw cbor::value_error(fmt::format("integer too large: can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
        if (std::cmp_less(from, std::numeric_limits<TO>::min())) [[unlikely]]
            throw cbor::value_error(fmt::format("integer too large: can't convert {} {} to {}: the value is too small", typeid(FROM).name(), from, typeid(TO).name()));
        return static_cast<TO>(from);
    }
}

#endif // !CBOR_TURBO_NARROW_CAST_HPP
