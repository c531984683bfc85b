/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <iterator>
#include <limits>
#include <utfcpp/utf8.h>
#include <ct/logger.hpp>
#include <ct/serde/serializer.hpp>
#include <ct/serde/tag.hpp>

namespace cbor_turbo::serde {
    collection_state::collection_state(serializer &ser, const bool ending, const bool tag):
        _ser { ser }, _ending { ending }, _tag { tag }
    {
    }

    void collection_state::element(const value &v)
    {
        if (_tag) {
            _tag = false;
            _ser._enc.tag(tag::extract(v));
            return;
        }
        _ser.write(v);
    }

    void collection_state::entry(const value &key, const value &val)
    {
        _ser.write(key);
        _ser.write(val);
    }

    void collection_state::field(const serde::field &f)
    {
        _ser._write_text(f.name);
        _ser.write(f.val);
    }

    void collection_state::end()
    {
        if (_ending)
            _ser._enc.s_break();
    }

    serializer::depth_guard::depth_guard(serializer &ser):
        _ser { ser }
    {
        if (_ser._depth_limit && _ser._depth >= *_ser._depth_limit) [[unlikely]] {
            logger::debug("the encode depth limit of {} has been reached", *_ser._depth_limit);
            throw cbor::recursion_limit_error { *_ser._depth_limit };
        }
        ++_ser._depth;
    }

    serializer::depth_guard::~depth_guard()
    {
        --_ser._depth;
    }

    serializer::serializer(cbor::sink &s, const std::optional<size_t> depth_limit):
        _enc { s }, _depth_limit { depth_limit }
    {
    }

    void serializer::flush()
    {
        _enc.flush();
    }

    void serializer::write(const value &v)
    {
        std::visit([&](const auto &val) {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, bool>) {
                if (val)
                    _enc.s_true();
                else
                    _enc.s_false();
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                _enc.uint(val);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                if (val >= 0)
                    _enc.uint(static_cast<uint64_t>(val));
                else
                    _enc.nint(~static_cast<uint64_t>(val));
            } else if constexpr (std::is_same_v<T, uint128_t>) {
                _write_uint(val);
            } else if constexpr (std::is_same_v<T, int128_t>) {
                _write_int(val);
            } else if constexpr (std::is_same_v<T, double>) {
                _enc.float64(val);
            } else if constexpr (std::is_same_v<T, char32_t>) {
                std::string s {};
                try {
                    utf8::append(static_cast<utf8::utfchar32_t>(val), std::back_inserter(s));
                } catch (const utf8::exception &ex) {
                    throw cbor::value_error(fmt::format("invalid character U+{:04X}", static_cast<uint32_t>(val)), ex);
                }
                _write_text(s);
            } else if constexpr (std::is_same_v<T, std::string>) {
                _write_text(val);
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                _enc.bytes(val);
            } else if constexpr (std::is_same_v<T, none_t> || std::is_same_v<T, unit_t> || std::is_same_v<T, unit_struct>) {
                _enc.s_null();
            } else if constexpr (std::is_same_v<T, unit_variant>) {
                _write_text(val.variant);
            } else if constexpr (std::is_same_v<T, newtype_struct>) {
                depth_guard g { *this };
                write(*val.inner);
            } else if constexpr (std::is_same_v<T, newtype_variant>) {
                if (val.name == tag::type_name && val.variant == tag::untagged_name) {
                    depth_guard g { *this };
                    write(*val.inner);
                } else {
                    depth_guard g { *this };
                    _enc.map(1);
                    _write_text(val.variant);
                    write(*val.inner);
                }
            } else if constexpr (std::is_same_v<T, seq>) {
                _write_items(val.items, !val.length_known);
            } else if constexpr (std::is_same_v<T, tuple> || std::is_same_v<T, tuple_struct>) {
                _write_items(val.items, false);
            } else if constexpr (std::is_same_v<T, tuple_variant>) {
                if (val.name == tag::type_name && val.variant == tag::tagged_name) {
                    if (val.items.size() != 2) [[unlikely]] {
                        logger::debug("a tagged value with {} fields", val.items.size());
                        throw cbor::value_error("a tagged value must have exactly two fields");
                    }
                    depth_guard g { *this };
                    collection_state st { *this, false, true };
                    for (const auto &it: val.items)
                        st.element(it);
                    st.end();
                } else {
                    depth_guard g { *this };
                    _enc.map(1);
                    _write_text(val.variant);
                    _write_items(val.items, false);
                }
            } else if constexpr (std::is_same_v<T, map>) {
                depth_guard g { *this };
                if (val.length_known)
                    _enc.map(val.entries.size());
                else
                    _enc.map();
                collection_state st { *this, !val.length_known, false };
                for (const auto &e: val.entries)
                    st.entry(e.key, e.val);
                st.end();
            } else if constexpr (std::is_same_v<T, record>) {
                _write_fields(val.fields);
            } else if constexpr (std::is_same_v<T, struct_variant>) {
                depth_guard g { *this };
                _enc.map(1);
                _write_text(val.variant);
                _write_fields(val.fields);
            } else if constexpr (std::is_same_v<T, tagged>) {
                depth_guard g { *this };
                if (val.tag)
                    _enc.tag(*val.tag);
                write(*val.inner);
            } else {
                static_assert(sizeof(T) == 0, "an unsupported value type");
            }
        }, static_cast<const value_base &>(v));
    }

    void serializer::_write_text(const std::string_view s)
    {
        _enc.text(s);
    }

    void serializer::_write_uint(const uint128_t &v)
    {
        if (v <= std::numeric_limits<uint64_t>::max())
            _enc.uint(static_cast<uint64_t>(v));
        else
            _write_big(cbor::tag::big_pos, v);
    }

    void serializer::_write_int(const int128_t &v)
    {
        if (v > int128_max() || v < int128_min()) [[unlikely]]
            throw cbor::value_error(fmt::format("integer too large: {} does not fit into 128 bits", v));
        if (v >= 0) {
            _write_uint(static_cast<uint128_t>(v));
            return;
        }
        const auto bias = big_int_bias(v);
        if (bias <= std::numeric_limits<uint64_t>::max())
            _enc.nint(static_cast<uint64_t>(bias));
        else
            _write_big(cbor::tag::big_neg, bias);
    }

    void serializer::_write_big(const uint64_t tag, const uint128_t &magnitude)
    {
        _enc.tag(tag);
        _enc.bytes(big_uint_to_bytes(magnitude));
    }

    void serializer::_write_items(const value_list &items, const bool ending)
    {
        depth_guard g { *this };
        if (ending)
            _enc.array();
        else
            _enc.array(items.size());
        collection_state st { *this, ending, false };
        for (const auto &it: items)
            st.element(it);
        st.end();
    }

    void serializer::_write_fields(const field_list &fields)
    {
        depth_guard g { *this };
        _enc.map(fields.size());
        collection_state st { *this, false, false };
        for (const auto &f: fields)
            st.field(f);
        st.end();
    }
}
