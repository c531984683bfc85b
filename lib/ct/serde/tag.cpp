/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <limits>
#include <ct/cbor/error.hpp>
#include <ct/logger.hpp>
#include <ct/serde/tag.hpp>

namespace cbor_turbo::serde::tag {
    uint64_t extract(const value &v)
    {
        return std::visit([&](const auto &val) -> uint64_t {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, uint64_t>) {
                return val;
            } else if constexpr (std::is_same_v<T, uint128_t>) {
                if (val <= std::numeric_limits<uint64_t>::max())
                    return static_cast<uint64_t>(val);
            } else if constexpr (std::is_same_v<T, newtype_struct>) {
                return extract(*val.inner);
            }
            logger::debug("a tagged value has a non-integer tag of type {}", v.type_name());
            throw cbor::value_error("expected tag");
        }, static_cast<const value_base &>(v));
    }

    value make_tagged(const uint64_t tag, value payload)
    {
        return tuple_variant { std::string { type_name }, 0, std::string { tagged_name }, { value { tag }, std::move(payload) } };
    }

    value make_untagged(value payload)
    {
        return newtype_variant { std::string { type_name }, 1, std::string { untagged_name }, std::move(payload) };
    }
}
