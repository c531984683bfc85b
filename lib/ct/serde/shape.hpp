/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_SERDE_SHAPE_HPP
#define CBOR_TURBO_SERDE_SHAPE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <ct/common/format.hpp>

namespace cbor_turbo::serde {
    enum class shape_kind: uint8_t {
        any, ignored, boolean,
        u8, u16, u32, u64, u128,
        i8, i16, i32, i64, i128,
        f32, f64, character, text, bytes,
        option, unit, unit_struct, newtype_struct,
        seq, tuple, tuple_struct, map, record,
        enumeration, unit_variant, newtype_variant, tuple_variant, struct_variant,
        tagged, tag_required, tag_accepted
    };

    // describes the value a deserializer is asked to produce
    struct shape {
        using field_list = std::vector<std::pair<std::string, shape>>;

        shape_kind kind = shape_kind::any;
        // the type name, or the variant name for variant shapes
        std::string name {};
        std::vector<shape> children {};
        // field names of records and struct variants, parallel to children
        std::vector<std::string> names {};
        uint64_t tag = 0;

        static shape of(shape_kind k)
        {
            return shape { k };
        }

        static shape any() { return of(shape_kind::any); }
        static shape ignored() { return of(shape_kind::ignored); }
        static shape boolean() { return of(shape_kind::boolean); }
        static shape u8() { return of(shape_kind::u8); }
        static shape u16() { return of(shape_kind::u16); }
        static shape u32() { return of(shape_kind::u32); }
        static shape u64() { return of(shape_kind::u64); }
        static shape u128() { return of(shape_kind::u128); }
        static shape i8() { return of(shape_kind::i8); }
        static shape i16() { return of(shape_kind::i16); }
        static shape i32() { return of(shape_kind::i32); }
        static shape i64() { return of(shape_kind::i64); }
        static shape i128() { return of(shape_kind::i128); }
        static shape f32() { return of(shape_kind::f32); }
        static shape f64() { return of(shape_kind::f64); }
        static shape character() { return of(shape_kind::character); }
        static shape text() { return of(shape_kind::text); }
        static shape bytes() { return of(shape_kind::bytes); }
        static shape unit() { return of(shape_kind::unit); }

        static shape option(shape inner);
        static shape unit_struct(std::string name);
        static shape newtype_struct(std::string name, shape inner);
        static shape seq(shape elem);
        static shape tuple(std::vector<shape> elems);
        static shape tuple_struct(std::string name, std::vector<shape> elems);
        static shape map(shape key, shape val);
        static shape record(std::string name, field_list fields);
        static shape enumeration(std::string name, std::vector<shape> variants);
        static shape unit_variant(std::string variant);
        static shape newtype_variant(std::string variant, shape inner);
        static shape tuple_variant(std::string variant, std::vector<shape> elems);
        static shape struct_variant(std::string variant, field_list fields);
        static shape tagged(shape inner);
        static shape tag_required(uint64_t tag, shape inner);
        static shape tag_accepted(uint64_t tag, shape inner);

        const shape &child(size_t idx) const;
    };
}

namespace fmt {
    template<>
    struct formatter<cbor_turbo::serde::shape_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using cbor_turbo::serde::shape_kind;
            switch (v) {
                case shape_kind::any: return fmt::format_to(ctx.out(), "any");
                case shape_kind::ignored: return fmt::format_to(ctx.out(), "ignored");
                case shape_kind::boolean: return fmt::format_to(ctx.out(), "boolean");
                case shape_kind::u8: return fmt::format_to(ctx.out(), "u8");
                case shape_kind::u16: return fmt::format_to(ctx.out(), "u16");
                case shape_kind::u32: return fmt::format_to(ctx.out(), "u32");
                case shape_kind::u64: return fmt::format_to(ctx.out(), "u64");
                case shape_kind::u128: return fmt::format_to(ctx.out(), "u128");
                case shape_kind::i8: return fmt::format_to(ctx.out(), "i8");
                case shape_kind::i16: return fmt::format_to(ctx.out(), "i16");
                case shape_kind::i32: return fmt::format_to(ctx.out(), "i32");
                case shape_kind::i64: return fmt::format_to(ctx.out(), "i64");
                case shape_kind::i128: return fmt::format_to(ctx.out(), "i128");
                case shape_kind::f32: return fmt::format_to(ctx.out(), "f32");
                case shape_kind::f64: return fmt::format_to(ctx.out(), "f64");
                case shape_kind::character: return fmt::format_to(ctx.out(), "character");
                case shape_kind::text: return fmt::format_to(ctx.out(), "text");
                case shape_kind::bytes: return fmt::format_to(ctx.out(), "bytes");
                case shape_kind::option: return fmt::format_to(ctx.out(), "option");
                case shape_kind::unit: return fmt::format_to(ctx.out(), "unit");
                case shape_kind::unit_struct: return fmt::format_to(ctx.out(), "unit_struct");
                case shape_kind::newtype_struct: return fmt::format_to(ctx.out(), "newtype_struct");
                case shape_kind::seq: return fmt::format_to(ctx.out(), "seq");
                case shape_kind::tuple: return fmt::format_to(ctx.out(), "tuple");
                case shape_kind::tuple_struct: return fmt::format_to(ctx.out(), "tuple_struct");
                case shape_kind::map: return fmt::format_to(ctx.out(), "map");
                case shape_kind::record: return fmt::format_to(ctx.out(), "record");
                case shape_kind::enumeration: return fmt::format_to(ctx.out(), "enumeration");
                case shape_kind::unit_variant: return fmt::format_to(ctx.out(), "unit_variant");
                case shape_kind::newtype_variant: return fmt::format_to(ctx.out(), "newtype_variant");
                case shape_kind::tuple_variant: return fmt::format_to(ctx.out(), "tuple_variant");
                case shape_kind::struct_variant: return fmt::format_to(ctx.out(), "struct_variant");
                case shape_kind::tagged: return fmt::format_to(ctx.out(), "tagged");
                case shape_kind::tag_required: return fmt::format_to(ctx.out(), "tag_required");
                case shape_kind::tag_accepted: return fmt::format_to(ctx.out(), "tag_accepted");
                default: return fmt::format_to(ctx.out(), "shape_kind: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !CBOR_TURBO_SERDE_SHAPE_HPP
