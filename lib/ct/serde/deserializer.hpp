/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_SERDE_DESERIALIZER_HPP
#define CBOR_TURBO_SERDE_DESERIALIZER_HPP

#include <string_view>
#include <ct/cbor/decoder.hpp>
#include <ct/serde/shape.hpp>
#include <ct/serde/value.hpp>

namespace cbor_turbo::serde {
    struct deserializer {
        // owned strings grow by at most this many bytes per read
        static constexpr size_t owned_segment_size = 0x1000;
        // the number of items reserved up front for a collection of a declared length
        static constexpr size_t max_reserve = 0x1000;

        // the scratch buffer must outlive the deserializer
        deserializer(cbor::source &src, write_buffer scratch, size_t recursion_limit);

        value read(const shape &s);
        // the views stay valid only until the next call to the deserializer
        std::string_view text_borrowed();
        buffer bytes_borrowed();

        size_t offset() const noexcept
        {
            return _dec.offset();
        }

        cbor::decoder &decoder() noexcept
        {
            return _dec;
        }
    private:
        struct integer {
            bool neg = false;
            uint128_t mag {};
        };

        cbor::decoder _dec;
        write_buffer _scratch;
        const size_t _limit;
        size_t _recurse;

        template<typename F>
        auto _nested(const F &f) -> decltype(f());

        cbor::header _pull_untagged();
        [[noreturn]] void _unexpected(const cbor::header &h, std::string_view expected) const;
        integer _pull_integer();
        uint128_t _read_big(std::string_view what);
        value _read_any();
        value _read_integer(shape_kind kind);
        value _read_float(shape_kind kind);
        std::string _read_text();
        std::string _read_text(const cbor::header &h);
        uint8_vector _read_bytes();
        char32_t _read_character();
        value_list _read_items(const std::vector<shape> &shapes, std::string_view what);
        value _read_seq(const shape &s);
        value _read_map(const shape &s);
        field_list _read_fields(const shape &s);
        value _read_enum(const shape &s);
        value _read_tagged(const shape &s);
        buffer _borrow(const cbor::header &h, std::string_view what);
        template<typename H>
        void _read_string(const H &hdr, uint8_vector &out, size_t max_size);
        void _append_segments(uint8_vector &out, uint64_t len, size_t max_size);
    };
}

#endif // !CBOR_TURBO_SERDE_DESERIALIZER_HPP
