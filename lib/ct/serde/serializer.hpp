/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_SERDE_SERIALIZER_HPP
#define CBOR_TURBO_SERDE_SERIALIZER_HPP

#include <optional>
#include <ct/cbor/encoder.hpp>
#include <ct/serde/value.hpp>

namespace cbor_turbo::serde {
    struct serializer;

    // the state of one open array, map or tagged construct
    struct collection_state {
        collection_state(serializer &ser, bool ending, bool tag);
        // the first element of a tag construct is the tag number, the rest are the payload
        void element(const value &v);
        void entry(const value &key, const value &val);
        void field(const serde::field &f);
        // writes a break iff the collection was opened without a known length
        void end();
    private:
        serializer &_ser;
        bool _ending;
        bool _tag;
    };

    struct serializer {
        explicit serializer(cbor::sink &s, std::optional<size_t> depth_limit={});
        void write(const value &v);
        void flush();

        static constexpr bool is_human_readable() noexcept
        {
            return false;
        }

        cbor::encoder &encoder() noexcept
        {
            return _enc;
        }
    private:
        friend struct collection_state;

        struct depth_guard {
            explicit depth_guard(serializer &ser);
            ~depth_guard();
        private:
            serializer &_ser;
        };

        cbor::encoder _enc;
        std::optional<size_t> _depth_limit;
        size_t _depth = 0;

        void _write_text(std::string_view s);
        void _write_uint(const uint128_t &v);
        void _write_int(const int128_t &v);
        void _write_big(uint64_t tag, const uint128_t &magnitude);
        void _write_items(const value_list &items, bool ending);
        void _write_fields(const field_list &fields);
    };
}

#endif // !CBOR_TURBO_SERDE_SERIALIZER_HPP
