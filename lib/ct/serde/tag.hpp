/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_SERDE_TAG_HPP
#define CBOR_TURBO_SERDE_TAG_HPP

#include <string_view>
#include <ct/serde/value.hpp>

namespace cbor_turbo::serde::tag {
    // reserved names of the type and variants that attach a tag number to a value
    static constexpr std::string_view type_name = "@@TAG@@";
    static constexpr std::string_view tagged_name = "@@TAGGED@@";
    static constexpr std::string_view untagged_name = "@@UNTAGGED@@";

    // the tag number held by the first field of a tagged tuple variant
    extern uint64_t extract(const value &v);

    // builders of the sentinel shapes the serializer recognizes
    extern value make_tagged(uint64_t tag, value payload);
    extern value make_untagged(value payload);
}

#endif // !CBOR_TURBO_SERDE_TAG_HPP
