/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_SERDE_VALUE_HPP
#define CBOR_TURBO_SERDE_VALUE_HPP

#include <memory>
#include <optional>
#include <string>
#include <typeinfo>
#include <variant>
#include <vector>
#include <ct/big-int.hpp>
#include <ct/common/bytes.hpp>
#include <ct/common/format.hpp>

namespace cbor_turbo::serde {
    // a heap-allocated value with value semantics
    template<typename T>
    struct boxed {
        boxed(T v):
            _ptr { std::make_shared<const T>(std::move(v)) }
        {
        }

        const T &operator*() const noexcept
        {
            return *_ptr;
        }

        const T *operator->() const noexcept
        {
            return _ptr.get();
        }

        bool operator==(const boxed &o) const
        {
            return *_ptr == *o._ptr;
        }
    private:
        std::shared_ptr<const T> _ptr;
    };

    struct value;
    struct field;
    struct map_entry;
    using value_list = std::vector<value>;
    using field_list = std::vector<field>;

    struct none_t {
        bool operator==(const none_t &) const =default;
    };

    struct unit_t {
        bool operator==(const unit_t &) const =default;
    };

    struct unit_struct {
        std::string name;
        bool operator==(const unit_struct &) const =default;
    };

    struct unit_variant {
        std::string name;
        uint32_t index = 0;
        std::string variant;
        bool operator==(const unit_variant &) const =default;
    };

    struct newtype_struct {
        std::string name;
        boxed<value> inner;
        bool operator==(const newtype_struct &) const =default;
    };

    struct newtype_variant {
        std::string name;
        uint32_t index = 0;
        std::string variant;
        boxed<value> inner;
        bool operator==(const newtype_variant &) const =default;
    };

    struct seq {
        value_list items {};
        bool length_known = true;
        bool operator==(const seq &) const;
    };

    struct tuple {
        value_list items {};
        bool operator==(const tuple &) const;
    };

    struct tuple_struct {
        std::string name;
        value_list items {};
        bool operator==(const tuple_struct &) const;
    };

    struct tuple_variant {
        std::string name;
        uint32_t index = 0;
        std::string variant;
        value_list items {};
        bool operator==(const tuple_variant &) const;
    };

    struct map {
        std::vector<map_entry> entries {};
        bool length_known = true;
        bool operator==(const map &) const;
    };

    struct record {
        std::string name;
        field_list fields {};
        bool operator==(const record &) const;
    };

    struct struct_variant {
        std::string name;
        uint32_t index = 0;
        std::string variant;
        field_list fields {};
        bool operator==(const struct_variant &) const;
    };

    // an explicitly tagged value, no tag header is written when the tag is unset
    struct tagged {
        std::optional<uint64_t> tag {};
        boxed<value> inner;
        bool operator==(const tagged &) const =default;
    };

    using value_base = std::variant<bool, uint64_t, int64_t, uint128_t, int128_t, double, char32_t, std::string, uint8_vector,
        none_t, unit_t, unit_struct, unit_variant, newtype_struct, newtype_variant,
        seq, tuple, tuple_struct, tuple_variant, map, record, struct_variant, tagged>;

    struct value: value_base {
        using value_base::value_base;

        template<typename T>
        const T &as() const
        {
            if (const auto *v = std::get_if<T>(this); v) [[likely]]
                return *v;
            throw error(fmt::format("expected a value of type {} but got {}", typeid(T).name(), type_name()));
        }

        const char *type_name() const;
        std::string to_string() const;
    };

    struct field {
        std::string name;
        value val;
        bool operator==(const field &) const =default;
    };

    struct map_entry {
        value key;
        value val;
        bool operator==(const map_entry &) const =default;
    };
}

namespace fmt {
    template<>
    struct formatter<cbor_turbo::serde::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !CBOR_TURBO_SERDE_VALUE_HPP
