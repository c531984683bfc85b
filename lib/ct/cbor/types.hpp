/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_CBOR_TYPES_HPP
#define CBOR_TURBO_CBOR_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <ct/common/format.hpp>

namespace cbor_turbo::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    namespace simple {
        static constexpr uint8_t s_false = static_cast<uint8_t>(special_val::s_false);
        static constexpr uint8_t s_true = static_cast<uint8_t>(special_val::s_true);
        static constexpr uint8_t s_null = static_cast<uint8_t>(special_val::s_null);
        static constexpr uint8_t s_undefined = static_cast<uint8_t>(special_val::s_undefined);
    }

    namespace tag {
        static constexpr uint64_t big_pos = 2;
        static constexpr uint64_t big_neg = 3;
    }

    struct positive_header {
        uint64_t val;
        bool operator==(const positive_header &) const =default;
    };

    // the true value is -1 - bias
    struct negative_header {
        uint64_t bias;
        bool operator==(const negative_header &) const =default;
    };

    struct float_header {
        double val;
        bool operator==(const float_header &) const =default;
    };

    struct simple_header {
        uint8_t code;
        bool operator==(const simple_header &) const =default;
    };

    struct tag_header {
        uint64_t id;
        bool operator==(const tag_header &) const =default;
    };

    struct break_header {
        bool operator==(const break_header &) const =default;
    };

    // std::nullopt length means an indefinite-length item terminated with a break
    struct bytes_header {
        std::optional<uint64_t> len {};
        bool operator==(const bytes_header &) const =default;
    };

    struct text_header {
        std::optional<uint64_t> len {};
        bool operator==(const text_header &) const =default;
    };

    struct array_header {
        std::optional<uint64_t> len {};
        bool operator==(const array_header &) const =default;
    };

    struct map_header {
        std::optional<uint64_t> len {};
        bool operator==(const map_header &) const =default;
    };

    using header = std::variant<positive_header, negative_header, float_header, simple_header, tag_header,
        break_header, bytes_header, text_header, array_header, map_header>;

    inline major_type header_major_type(const header &h)
    {
        return std::visit([](const auto &hv) {
            using T = std::decay_t<decltype(hv)>;
            if constexpr (std::is_same_v<T, positive_header>) {
                return major_type::uint;
            } else if constexpr (std::is_same_v<T, negative_header>) {
                return major_type::nint;
            } else if constexpr (std::is_same_v<T, bytes_header>) {
                return major_type::bytes;
            } else if constexpr (std::is_same_v<T, text_header>) {
                return major_type::text;
            } else if constexpr (std::is_same_v<T, array_header>) {
                return major_type::array;
            } else if constexpr (std::is_same_v<T, map_header>) {
                return major_type::map;
            } else if constexpr (std::is_same_v<T, tag_header>) {
                return major_type::tag;
            } else {
                return major_type::simple;
            }
        }, h);
    }

    inline std::string_view header_name(const header &h)
    {
        return std::visit([](const auto &hv) -> std::string_view {
            using T = std::decay_t<decltype(hv)>;
            if constexpr (std::is_same_v<T, positive_header>) {
                return "positive integer";
            } else if constexpr (std::is_same_v<T, negative_header>) {
                return "negative integer";
            } else if constexpr (std::is_same_v<T, float_header>) {
                return "float";
            } else if constexpr (std::is_same_v<T, simple_header>) {
                switch (hv.code) {
                    case simple::s_false: return "false";
                    case simple::s_true: return "true";
                    case simple::s_null: return "null";
                    case simple::s_undefined: return "undefined";
                    default: return "simple value";
                }
            } else if constexpr (std::is_same_v<T, tag_header>) {
                return "tag";
            } else if constexpr (std::is_same_v<T, break_header>) {
                return "break";
            } else if constexpr (std::is_same_v<T, bytes_header>) {
                return "bytes";
            } else if constexpr (std::is_same_v<T, text_header>) {
                return "text";
            } else if constexpr (std::is_same_v<T, array_header>) {
                return "array";
            } else {
                return "map";
            }
        }, h);
    }
}

namespace fmt {
    template<>
    struct formatter<cbor_turbo::cbor::special_val>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using cbor_turbo::cbor::special_val;
            switch (v) {
                case special_val::s_false: return fmt::format_to(ctx.out(), "false");
                case special_val::s_true: return fmt::format_to(ctx.out(), "true");
                case special_val::s_null: return fmt::format_to(ctx.out(), "null");
                case special_val::s_undefined: return fmt::format_to(ctx.out(), "undefined");
                case special_val::one_byte: return fmt::format_to(ctx.out(), "one_byte");
                case special_val::two_bytes: return fmt::format_to(ctx.out(), "two_bytes");
                case special_val::four_bytes: return fmt::format_to(ctx.out(), "four_bytes");
                case special_val::eight_bytes: return fmt::format_to(ctx.out(), "eight_bytes");
                case special_val::s_break: return fmt::format_to(ctx.out(), "break");
                default: return fmt::format_to(ctx.out(), "special_value: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<cbor_turbo::cbor::major_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using cbor_turbo::cbor::major_type;
            switch (v) {
                case major_type::uint: return fmt::format_to(ctx.out(), "uint");
                case major_type::nint: return fmt::format_to(ctx.out(), "nint");
                case major_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case major_type::text: return fmt::format_to(ctx.out(), "text");
                case major_type::array: return fmt::format_to(ctx.out(), "array");
                case major_type::map: return fmt::format_to(ctx.out(), "map");
                case major_type::tag: return fmt::format_to(ctx.out(), "tag");
                case major_type::simple: return fmt::format_to(ctx.out(), "simple");
                default: return fmt::format_to(ctx.out(), "major_type: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<cbor_turbo::cbor::header>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace cbor_turbo::cbor;
            return std::visit([&](const auto &hv) {
                using T = std::decay_t<decltype(hv)>;
                if constexpr (std::is_same_v<T, positive_header>) {
                    return fmt::format_to(ctx.out(), "positive({})", hv.val);
                } else if constexpr (std::is_same_v<T, negative_header>) {
                    return fmt::format_to(ctx.out(), "negative(bias: {})", hv.bias);
                } else if constexpr (std::is_same_v<T, float_header>) {
                    return fmt::format_to(ctx.out(), "float({})", hv.val);
                } else if constexpr (std::is_same_v<T, simple_header>) {
                    return fmt::format_to(ctx.out(), "simple({})", hv.code);
                } else if constexpr (std::is_same_v<T, tag_header>) {
                    return fmt::format_to(ctx.out(), "tag({})", hv.id);
                } else if constexpr (std::is_same_v<T, break_header>) {
                    return fmt::format_to(ctx.out(), "break");
                } else {
                    return fmt::format_to(ctx.out(), "{}({})", header_name(v), hv.len);
                }
            }, v);
        }
    };
}

#endif // !CBOR_TURBO_CBOR_TYPES_HPP
