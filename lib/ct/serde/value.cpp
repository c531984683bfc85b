/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <ct/serde/value.hpp>

namespace cbor_turbo::serde {
    bool seq::operator==(const seq &o) const
    {
        return length_known == o.length_known && items == o.items;
    }

    bool tuple::operator==(const tuple &o) const
    {
        return items == o.items;
    }

    bool tuple_struct::operator==(const tuple_struct &o) const
    {
        return name == o.name && items == o.items;
    }

    bool tuple_variant::operator==(const tuple_variant &o) const
    {
        return name == o.name && index == o.index && variant == o.variant && items == o.items;
    }

    bool map::operator==(const map &o) const
    {
        return length_known == o.length_known && entries == o.entries;
    }

    bool record::operator==(const record &o) const
    {
        return name == o.name && fields == o.fields;
    }

    bool struct_variant::operator==(const struct_variant &o) const
    {
        return name == o.name && index == o.index && variant == o.variant && fields == o.fields;
    }

    const char *value::type_name() const
    {
        return std::visit([](const auto &v) -> const char * {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) return "bool";
            else if constexpr (std::is_same_v<T, uint64_t>) return "uint64";
            else if constexpr (std::is_same_v<T, int64_t>) return "int64";
            else if constexpr (std::is_same_v<T, uint128_t>) return "uint128";
            else if constexpr (std::is_same_v<T, int128_t>) return "int128";
            else if constexpr (std::is_same_v<T, double>) return "float";
            else if constexpr (std::is_same_v<T, char32_t>) return "char";
            else if constexpr (std::is_same_v<T, std::string>) return "text";
            else if constexpr (std::is_same_v<T, uint8_vector>) return "bytes";
            else if constexpr (std::is_same_v<T, none_t>) return "none";
            else if constexpr (std::is_same_v<T, unit_t>) return "unit";
            else if constexpr (std::is_same_v<T, unit_struct>) return "unit_struct";
            else if constexpr (std::is_same_v<T, unit_variant>) return "unit_variant";
            else if constexpr (std::is_same_v<T, newtype_struct>) return "newtype_struct";
            else if constexpr (std::is_same_v<T, newtype_variant>) return "newtype_variant";
            else if constexpr (std::is_same_v<T, seq>) return "seq";
            else if constexpr (std::is_same_v<T, tuple>) return "tuple";
            else if constexpr (std::is_same_v<T, tuple_struct>) return "tuple_struct";
            else if constexpr (std::is_same_v<T, tuple_variant>) return "tuple_variant";
            else if constexpr (std::is_same_v<T, map>) return "map";
            else if constexpr (std::is_same_v<T, record>) return "record";
            else if constexpr (std::is_same_v<T, struct_variant>) return "struct_variant";
            else if constexpr (std::is_same_v<T, tagged>) return "tagged";
            else static_assert(sizeof(T) == 0, "an unsupported value type");
        }, static_cast<const value_base &>(*this));
    }

    static std::string items_to_string(const value_list &items)
    {
        std::string res {};
        for (const auto &it: items) {
            if (!res.empty())
                res += ", ";
            res += it.to_string();
        }
        return res;
    }

    static std::string fields_to_string(const field_list &fields)
    {
        std::string res {};
        for (const auto &f: fields) {
            if (!res.empty())
                res += ", ";
            res += fmt::format("{}: {}", f.name, f.val.to_string());
        }
        return res;
    }

    std::string value::to_string() const
    {
        return std::visit([](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, uint64_t> || std::is_same_v<T, int64_t> || std::is_same_v<T, double>
                    || std::is_same_v<T, uint128_t> || std::is_same_v<T, int128_t>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, char32_t>) {
                return fmt::format("char(U+{:04X})", static_cast<uint32_t>(v));
            } else if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("\"{}\"", v);
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                return fmt::format("h'{}'", v);
            } else if constexpr (std::is_same_v<T, none_t>) {
                return "none";
            } else if constexpr (std::is_same_v<T, unit_t>) {
                return "()";
            } else if constexpr (std::is_same_v<T, unit_struct>) {
                return v.name;
            } else if constexpr (std::is_same_v<T, unit_variant>) {
                return fmt::format("{}::{}", v.name, v.variant);
            } else if constexpr (std::is_same_v<T, newtype_struct>) {
                return fmt::format("{}({})", v.name, v.inner->to_string());
            } else if constexpr (std::is_same_v<T, newtype_variant>) {
                return fmt::format("{}::{}({})", v.name, v.variant, v.inner->to_string());
            } else if constexpr (std::is_same_v<T, seq>) {
                return fmt::format("[{}{}]", v.length_known ? "" : "_ ", items_to_string(v.items));
            } else if constexpr (std::is_same_v<T, tuple>) {
                return fmt::format("({})", items_to_string(v.items));
            } else if constexpr (std::is_same_v<T, tuple_struct>) {
                return fmt::format("{}({})", v.name, items_to_string(v.items));
            } else if constexpr (std::is_same_v<T, tuple_variant>) {
                return fmt::format("{}::{}({})", v.name, v.variant, items_to_string(v.items));
            } else if constexpr (std::is_same_v<T, map>) {
                std::string res {};
                for (const auto &e: v.entries) {
                    if (!res.empty())
                        res += ", ";
                    res += fmt::format("{}: {}", e.key.to_string(), e.val.to_string());
                }
                return fmt::format("{{{}{}}}", v.length_known ? "" : "_ ", res);
            } else if constexpr (std::is_same_v<T, record>) {
                return fmt::format("{} {{{}}}", v.name, fields_to_string(v.fields));
            } else if constexpr (std::is_same_v<T, struct_variant>) {
                return fmt::format("{}::{} {{{}}}", v.name, v.variant, fields_to_string(v.fields));
            } else if constexpr (std::is_same_v<T, tagged>) {
                if (v.tag)
                    return fmt::format("{}({})", *v.tag, v.inner->to_string());
                return fmt::format("untagged({})", v.inner->to_string());
            } else {
                static_assert(sizeof(T) == 0, "an unsupported value type");
            }
        }, static_cast<const value_base &>(*this));
    }
}
