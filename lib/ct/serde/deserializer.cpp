/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <cmath>
#include <limits>
#include <utfcpp/utf8.h>
#include <ct/logger.hpp>
#include <ct/narrow-cast.hpp>
#include <ct/serde/deserializer.hpp>

namespace cbor_turbo::serde {
    using cbor::header;

    template<typename T>
    static value unsigned_value(const bool neg, const uint128_t &mag)
    {
        if (neg) [[unlikely]]
            throw cbor::value_error(fmt::format("integer too large: -1 - {} can not be stored in an unsigned integer", mag));
        if (mag > std::numeric_limits<uint64_t>::max()) [[unlikely]]
            throw cbor::value_error(fmt::format("integer too large: {} does not fit into 64 bits", mag));
        return value { static_cast<uint64_t>(narrow_cast<T>(static_cast<uint64_t>(mag))) };
    }

    template<typename T>
    static value signed_value(const bool neg, const uint128_t &mag)
    {
        if (mag > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) [[unlikely]]
            throw cbor::value_error(fmt::format("integer too large: {}{} does not fit into 64 bits", neg ? "-1 - " : "", mag));
        const auto v = static_cast<int64_t>(static_cast<uint64_t>(mag));
        return value { static_cast<int64_t>(narrow_cast<T>(neg ? -1 - v : v)) };
    }

    static bool is_null(const header &h)
    {
        const auto *s = std::get_if<cbor::simple_header>(&h);
        return s && (s->code == cbor::simple::s_null || s->code == cbor::simple::s_undefined);
    }

    static size_t find_name(const std::vector<std::string> &names, const std::string_view name)
    {
        const auto it = std::find(names.begin(), names.end(), name);
        return static_cast<size_t>(it - names.begin());
    }

    static size_t find_variant(const shape &s, const std::string_view name)
    {
        for (size_t i = 0; i < s.children.size(); ++i) {
            if (s.children[i].name == name)
                return i;
        }
        throw cbor::value_error(fmt::format("unknown variant {} of enum {}", name, s.name));
    }

    deserializer::deserializer(cbor::source &src, const write_buffer scratch, const size_t recursion_limit):
        _dec { src }, _scratch { scratch }, _limit { recursion_limit }, _recurse { recursion_limit }
    {
    }

    template<typename F>
    auto deserializer::_nested(const F &f) -> decltype(f())
    {
        if (_recurse == 0) [[unlikely]] {
            logger::debug("the decode recursion limit of {} has been reached at offset {}", _limit, _dec.offset());
            throw cbor::recursion_limit_error { _limit };
        }
        --_recurse;
        struct restore {
            size_t &recurse;
            ~restore()
            {
                ++recurse;
            }
        } r { _recurse };
        return f();
    }

    value deserializer::read(const shape &s)
    {
        switch (s.kind) {
            case shape_kind::any:
                return _read_any();
            case shape_kind::ignored:
                _dec.skip();
                return none_t {};
            case shape_kind::boolean: {
                const auto h = _pull_untagged();
                if (const auto *sh = std::get_if<cbor::simple_header>(&h); sh) {
                    if (sh->code == cbor::simple::s_false)
                        return false;
                    if (sh->code == cbor::simple::s_true)
                        return true;
                }
                _unexpected(h, "a boolean");
            }
            case shape_kind::u8: case shape_kind::u16: case shape_kind::u32: case shape_kind::u64: case shape_kind::u128:
            case shape_kind::i8: case shape_kind::i16: case shape_kind::i32: case shape_kind::i64: case shape_kind::i128:
                return _read_integer(s.kind);
            case shape_kind::f32:
            case shape_kind::f64:
                return _read_float(s.kind);
            case shape_kind::character:
                return _read_character();
            case shape_kind::text:
                return _read_text();
            case shape_kind::bytes:
                return _read_bytes();
            case shape_kind::option: {
                const auto h = _dec.pull();
                if (is_null(h))
                    return none_t {};
                _dec.push(h);
                return read(s.child(0));
            }
            case shape_kind::unit:
            case shape_kind::unit_struct: {
                const auto h = _pull_untagged();
                if (!is_null(h)) [[unlikely]]
                    _unexpected(h, "null");
                if (s.kind == shape_kind::unit)
                    return unit_t {};
                return unit_struct { s.name };
            }
            case shape_kind::newtype_struct:
                return newtype_struct { s.name, read(s.child(0)) };
            case shape_kind::seq:
                return _read_seq(s);
            case shape_kind::tuple:
                return tuple { _read_items(s.children, "a tuple") };
            case shape_kind::tuple_struct:
                return tuple_struct { s.name, _read_items(s.children, s.name) };
            case shape_kind::map:
                return _read_map(s);
            case shape_kind::record:
                return record { s.name, _read_fields(s) };
            case shape_kind::enumeration:
                return _read_enum(s);
            case shape_kind::tagged:
            case shape_kind::tag_required:
            case shape_kind::tag_accepted:
                return _read_tagged(s);
            default:
                throw error(fmt::format("a {} shape can be decoded only as a part of an enumeration", s.kind));
        }
    }

    std::string_view deserializer::text_borrowed()
    {
        const auto h = _pull_untagged();
        if (!std::holds_alternative<cbor::text_header>(h)) [[unlikely]]
            _unexpected(h, "a text");
        const auto bytes = _borrow(h, "text");
        if (!utf8::is_valid(bytes.begin(), bytes.end())) [[unlikely]]
            throw cbor::syntax_error(_dec.header_offset(), "a text string is not valid UTF-8");
        return static_cast<std::string_view>(bytes);
    }

    buffer deserializer::bytes_borrowed()
    {
        const auto h = _pull_untagged();
        if (!std::holds_alternative<cbor::bytes_header>(h)) [[unlikely]]
            _unexpected(h, "bytes");
        return _borrow(h, "bytes");
    }

    buffer deserializer::_borrow(const header &h, const std::string_view what)
    {
        const auto len = std::visit([&](const auto &hv) -> uint64_t {
            using T = std::decay_t<decltype(hv)>;
            if constexpr (std::is_same_v<T, cbor::text_header> || std::is_same_v<T, cbor::bytes_header>) {
                if (!hv.len) [[unlikely]]
                    throw cbor::value_error(fmt::format("indefinite-length {} can not be borrowed", what));
                return *hv.len;
            } else {
                throw error(fmt::format("can't borrow {}", cbor::header_name(h)));
            }
        }, h);
        if (len > std::numeric_limits<size_t>::max()) [[unlikely]]
            throw cbor::value_error(fmt::format("{} of {} bytes can not be borrowed", what, len));
        if (const auto view = _dec.borrow(static_cast<size_t>(len)); view)
            return *view;
        if (len > _scratch.size()) [[unlikely]]
            throw cbor::value_error(fmt::format("{} of {} bytes does not fit into the scratch buffer of {} bytes", what, len, _scratch.size()));
        const write_buffer out { _scratch.data(), static_cast<size_t>(len) };
        _dec.read_exact(out);
        return buffer { out.data(), out.size() };
    }

    header deserializer::_pull_untagged()
    {
        for (;;) {
            auto h = _dec.pull();
            if (!std::holds_alternative<cbor::tag_header>(h))
                return h;
        }
    }

    void deserializer::_unexpected(const header &h, const std::string_view expected) const
    {
        throw cbor::value_error(fmt::format("expected {} but got {} at offset {}", expected, cbor::header_name(h), _dec.header_offset()));
    }

    deserializer::integer deserializer::_pull_integer()
    {
        for (;;) {
            const auto h = _dec.pull();
            if (const auto *p = std::get_if<cbor::positive_header>(&h); p)
                return { false, p->val };
            if (const auto *n = std::get_if<cbor::negative_header>(&h); n)
                return { true, n->bias };
            const auto *t = std::get_if<cbor::tag_header>(&h);
            if (!t) [[unlikely]]
                _unexpected(h, "an integer");
            if (t->id == cbor::tag::big_pos)
                return { false, _read_big("a positive bignum") };
            if (t->id == cbor::tag::big_neg)
                return { true, _read_big("a negative bignum") };
        }
    }

    uint128_t deserializer::_read_big(const std::string_view what)
    {
        const auto h = _dec.pull();
        const auto *bh = std::get_if<cbor::bytes_header>(&h);
        if (!bh) [[unlikely]]
            _unexpected(h, what);
        uint8_vector bytes {};
        _read_string(*bh, bytes, big_int_max_size);
        return big_uint_from_bytes(bytes);
    }

    value deserializer::_read_integer(const shape_kind kind)
    {
        const auto [neg, mag] = _pull_integer();
        switch (kind) {
            case shape_kind::u8: return unsigned_value<uint8_t>(neg, mag);
            case shape_kind::u16: return unsigned_value<uint16_t>(neg, mag);
            case shape_kind::u32: return unsigned_value<uint32_t>(neg, mag);
            case shape_kind::u64: return unsigned_value<uint64_t>(neg, mag);
            case shape_kind::i8: return signed_value<int8_t>(neg, mag);
            case shape_kind::i16: return signed_value<int16_t>(neg, mag);
            case shape_kind::i32: return signed_value<int32_t>(neg, mag);
            case shape_kind::i64: return signed_value<int64_t>(neg, mag);
            case shape_kind::u128:
                if (neg) [[unlikely]]
                    throw cbor::value_error(fmt::format("integer too large: -1 - {} can not be stored in an unsigned integer", mag));
                return mag;
            case shape_kind::i128:
                if (neg)
                    return big_int_from_bias(mag);
                if (mag > static_cast<uint128_t>(int128_max())) [[unlikely]]
                    throw cbor::value_error(fmt::format("integer too large: {} does not fit into 128 bits", mag));
                return static_cast<int128_t>(mag);
            default:
                throw error(fmt::format("{} is not an integer shape", kind));
        }
    }

    value deserializer::_read_float(const shape_kind kind)
    {
        const auto h = _pull_untagged();
        const auto *fh = std::get_if<cbor::float_header>(&h);
        if (!fh) [[unlikely]]
            _unexpected(h, "a float");
        if (kind == shape_kind::f32) {
            // out-of-range magnitudes saturate to infinity
            if (std::isfinite(fh->val) && std::fabs(fh->val) > std::numeric_limits<float>::max())
                return std::copysign(std::numeric_limits<double>::infinity(), fh->val);
            return static_cast<double>(static_cast<float>(fh->val));
        }
        return fh->val;
    }

    template<typename H>
    void deserializer::_read_string(const H &hdr, uint8_vector &out, const size_t max_size)
    {
        if (hdr.len) {
            _append_segments(out, *hdr.len, max_size);
            return;
        }
        for (;;) {
            const auto h = _dec.pull();
            if (std::holds_alternative<cbor::break_header>(h))
                break;
            const auto *chunk = std::get_if<H>(&h);
            if (!chunk || !chunk->len) [[unlikely]]
                throw cbor::syntax_error(_dec.header_offset(), fmt::format("an indefinite-length {} contains a chunk of type {}",
                    cbor::header_name(header { hdr }), cbor::header_name(h)));
            const auto chunk_start = out.size();
            _append_segments(out, *chunk->len, max_size);
            if constexpr (std::is_same_v<H, cbor::text_header>) {
                if (!utf8::is_valid(out.begin() + chunk_start, out.end())) [[unlikely]]
                    throw cbor::syntax_error(_dec.header_offset(), "a text chunk is not valid UTF-8");
            }
        }
    }

    void deserializer::_append_segments(uint8_vector &out, uint64_t len, const size_t max_size)
    {
        if (len > max_size - out.size()) [[unlikely]]
            throw cbor::value_error(fmt::format("a string of {} bytes exceeds the limit of {} bytes", out.size() + len, max_size));
        while (len > 0) {
            const auto seg = static_cast<size_t>(std::min<uint64_t>(len, owned_segment_size));
            const auto start = out.size();
            out.resize(start + seg);
            _dec.read_exact(write_buffer { out.data() + start, seg });
            len -= seg;
        }
    }

    std::string deserializer::_read_text()
    {
        return _read_text(_pull_untagged());
    }

    std::string deserializer::_read_text(const header &h)
    {
        const auto *th = std::get_if<cbor::text_header>(&h);
        if (!th) [[unlikely]]
            _unexpected(h, "a text");
        const auto start_offset = _dec.header_offset();
        uint8_vector bytes {};
        _read_string(*th, bytes, std::numeric_limits<size_t>::max());
        if (!utf8::is_valid(bytes.begin(), bytes.end())) [[unlikely]]
            throw cbor::syntax_error(start_offset, "a text string is not valid UTF-8");
        return std::string { bytes.str() };
    }

    uint8_vector deserializer::_read_bytes()
    {
        const auto h = _pull_untagged();
        if (const auto *bh = std::get_if<cbor::bytes_header>(&h); bh) {
            uint8_vector bytes {};
            _read_string(*bh, bytes, std::numeric_limits<size_t>::max());
            return bytes;
        }
        const auto *ah = std::get_if<cbor::array_header>(&h);
        if (!ah) [[unlikely]]
            _unexpected(h, "bytes");
        return _nested([&] {
            uint8_vector bytes {};
            for (uint64_t i = 0; !ah->len || i < *ah->len; ++i) {
                if (!ah->len) {
                    const auto next = _dec.pull();
                    if (std::holds_alternative<cbor::break_header>(next))
                        break;
                    _dec.push(next);
                }
                bytes.emplace_back(static_cast<uint8_t>(_read_integer(shape_kind::u8).as<uint64_t>()));
            }
            return bytes;
        });
    }

    char32_t deserializer::_read_character()
    {
        const auto s = _read_text();
        if (s.empty() || utf8::distance(s.begin(), s.end()) != 1) [[unlikely]]
            throw cbor::value_error(fmt::format("expected a single character but got a text of {} bytes", s.size()));
        return static_cast<char32_t>(utf8::peek_next(s.begin(), s.end()));
    }

    value_list deserializer::_read_items(const std::vector<shape> &shapes, const std::string_view what)
    {
        const auto h = _pull_untagged();
        const auto *ah = std::get_if<cbor::array_header>(&h);
        if (!ah) [[unlikely]]
            _unexpected(h, fmt::format("an array for {}", what));
        if (ah->len && *ah->len != shapes.size()) [[unlikely]]
            throw cbor::value_error(fmt::format("expected {} items for {} but got {}", shapes.size(), what, *ah->len));
        return _nested([&] {
            value_list items {};
            items.reserve(shapes.size());
            for (const auto &s: shapes) {
                if (!ah->len) {
                    const auto next = _dec.pull();
                    if (std::holds_alternative<cbor::break_header>(next)) [[unlikely]]
                        throw cbor::value_error(fmt::format("expected {} items for {} but got {}", shapes.size(), what, items.size()));
                    _dec.push(next);
                }
                items.emplace_back(read(s));
            }
            if (!ah->len) {
                const auto next = _dec.pull();
                if (!std::holds_alternative<cbor::break_header>(next)) [[unlikely]]
                    throw cbor::value_error(fmt::format("expected {} items for {} but got more", shapes.size(), what));
            }
            return items;
        });
    }

    value deserializer::_read_seq(const shape &s)
    {
        const auto h = _pull_untagged();
        const auto *ah = std::get_if<cbor::array_header>(&h);
        if (!ah) [[unlikely]]
            _unexpected(h, "an array");
        return _nested([&] {
            seq res { {}, ah->len.has_value() };
            if (ah->len) {
                res.items.reserve(static_cast<size_t>(std::min<uint64_t>(*ah->len, max_reserve)));
                for (uint64_t i = 0; i < *ah->len; ++i)
                    res.items.emplace_back(read(s.child(0)));
            } else {
                for (;;) {
                    const auto next = _dec.pull();
                    if (std::holds_alternative<cbor::break_header>(next))
                        break;
                    _dec.push(next);
                    res.items.emplace_back(read(s.child(0)));
                }
            }
            return value { std::move(res) };
        });
    }

    value deserializer::_read_map(const shape &s)
    {
        const auto h = _pull_untagged();
        const auto *mh = std::get_if<cbor::map_header>(&h);
        if (!mh) [[unlikely]]
            _unexpected(h, "a map");
        return _nested([&] {
            map res { {}, mh->len.has_value() };
            if (mh->len)
                res.entries.reserve(static_cast<size_t>(std::min<uint64_t>(*mh->len, max_reserve)));
            for (uint64_t i = 0; !mh->len || i < *mh->len; ++i) {
                if (!mh->len) {
                    const auto next = _dec.pull();
                    if (std::holds_alternative<cbor::break_header>(next))
                        break;
                    _dec.push(next);
                }
                auto key = read(s.child(0));
                auto val = read(s.child(1));
                res.entries.emplace_back(std::move(key), std::move(val));
            }
            return value { std::move(res) };
        });
    }

    field_list deserializer::_read_fields(const shape &s)
    {
        const auto h = _pull_untagged();
        const auto *mh = std::get_if<cbor::map_header>(&h);
        if (!mh) [[unlikely]]
            _unexpected(h, fmt::format("a map for {}", s.name));
        return _nested([&] {
            std::vector<std::optional<value>> vals(s.children.size());
            for (uint64_t i = 0; !mh->len || i < *mh->len; ++i) {
                auto key_h = _pull_untagged();
                if (!mh->len && std::holds_alternative<cbor::break_header>(key_h))
                    break;
                const auto key = _read_text(key_h);
                const auto idx = find_name(s.names, key);
                if (idx == s.names.size()) {
                    _dec.skip();
                    continue;
                }
                if (vals[idx]) [[unlikely]]
                    throw cbor::value_error(fmt::format("duplicate field {} in {}", key, s.name));
                vals[idx].emplace(read(s.children[idx]));
            }
            field_list fields {};
            fields.reserve(vals.size());
            for (size_t i = 0; i < vals.size(); ++i) {
                if (vals[i]) {
                    fields.emplace_back(s.names[i], std::move(*vals[i]));
                } else if (s.children[i].kind == shape_kind::option) {
                    fields.emplace_back(s.names[i], none_t {});
                } else [[unlikely]] {
                    throw cbor::value_error(fmt::format("missing field {} in {}", s.names[i], s.name));
                }
            }
            return fields;
        });
    }

    value deserializer::_read_enum(const shape &s)
    {
        const auto h = _pull_untagged();
        if (std::holds_alternative<cbor::text_header>(h)) {
            const auto name = _read_text(h);
            const auto idx = find_variant(s, name);
            const auto &var = s.children[idx];
            if (var.kind != shape_kind::unit_variant) [[unlikely]]
                throw cbor::value_error(fmt::format("variant {} of enum {} is a {} but was encoded as a unit variant", name, s.name, var.kind));
            return unit_variant { s.name, static_cast<uint32_t>(idx), var.name };
        }
        const auto *mh = std::get_if<cbor::map_header>(&h);
        if (!mh || mh->len != 1U) [[unlikely]]
            _unexpected(h, fmt::format("a text or a single-entry map for enum {}", s.name));
        return _nested([&]() -> value {
            const auto name = _read_text();
            const auto idx = static_cast<uint32_t>(find_variant(s, name));
            const auto &var = s.children[idx];
            switch (var.kind) {
                case shape_kind::unit_variant: {
                    const auto payload = _pull_untagged();
                    if (!is_null(payload)) [[unlikely]]
                        _unexpected(payload, "null");
                    return unit_variant { s.name, idx, var.name };
                }
                case shape_kind::newtype_variant:
                    return newtype_variant { s.name, idx, var.name, read(var.child(0)) };
                case shape_kind::tuple_variant:
                    return tuple_variant { s.name, idx, var.name, _read_items(var.children, var.name) };
                case shape_kind::struct_variant:
                    return struct_variant { s.name, idx, var.name, _read_fields(var) };
                default:
                    throw error(fmt::format("unsupported variant kind: {}", var.kind));
            }
        });
    }

    value deserializer::_read_tagged(const shape &s)
    {
        const auto h = _dec.pull();
        const auto *th = std::get_if<cbor::tag_header>(&h);
        if (!th) {
            if (s.kind == shape_kind::tag_required) [[unlikely]]
                _unexpected(h, fmt::format("tag {}", s.tag));
            _dec.push(h);
            return tagged { {}, read(s.child(0)) };
        }
        if (s.kind != shape_kind::tagged && th->id != s.tag) [[unlikely]] {
            logger::debug("expected tag {} but got tag {} at offset {}", s.tag, th->id, _dec.header_offset());
            throw cbor::value_error(fmt::format("expected tag {} but got tag {}", s.tag, th->id));
        }
        const auto id = th->id;
        return _nested([&] {
            return value { tagged { id, read(s.child(0)) } };
        });
    }

    value deserializer::_read_any()
    {
        const auto h = _dec.pull();
        return std::visit([&](const auto &hv) -> value {
            using T = std::decay_t<decltype(hv)>;
            if constexpr (std::is_same_v<T, cbor::positive_header>) {
                return hv.val;
            } else if constexpr (std::is_same_v<T, cbor::negative_header>) {
                if (hv.bias <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                    return static_cast<int64_t>(~hv.bias);
                return big_int_from_bias(hv.bias);
            } else if constexpr (std::is_same_v<T, cbor::float_header>) {
                return hv.val;
            } else if constexpr (std::is_same_v<T, cbor::simple_header>) {
                switch (hv.code) {
                    case cbor::simple::s_false: return false;
                    case cbor::simple::s_true: return true;
                    case cbor::simple::s_null:
                    case cbor::simple::s_undefined:
                        return none_t {};
                    default:
                        throw cbor::value_error(fmt::format("unsupported simple value {} at offset {}", hv.code, _dec.header_offset()));
                }
            } else if constexpr (std::is_same_v<T, cbor::break_header>) {
                throw cbor::syntax_error(_dec.header_offset(), "an unexpected break");
            } else if constexpr (std::is_same_v<T, cbor::bytes_header>) {
                uint8_vector bytes {};
                _read_string(hv, bytes, std::numeric_limits<size_t>::max());
                return bytes;
            } else if constexpr (std::is_same_v<T, cbor::text_header>) {
                return _read_text(h);
            } else if constexpr (std::is_same_v<T, cbor::array_header>) {
                _dec.push(h);
                return _read_seq(shape::seq(shape::any()));
            } else if constexpr (std::is_same_v<T, cbor::map_header>) {
                _dec.push(h);
                return _read_map(shape::map(shape::any(), shape::any()));
            } else if constexpr (std::is_same_v<T, cbor::tag_header>) {
                if (hv.id == cbor::tag::big_pos || hv.id == cbor::tag::big_neg) {
                    const auto next = _dec.pull();
                    _dec.push(next);
                    if (std::holds_alternative<cbor::bytes_header>(next)) {
                        const auto mag = _read_big("a bignum");
                        if (hv.id == cbor::tag::big_pos) {
                            if (mag <= std::numeric_limits<uint64_t>::max())
                                return static_cast<uint64_t>(mag);
                            return mag;
                        }
                        if (mag <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                            return static_cast<int64_t>(~static_cast<uint64_t>(mag));
                        return big_int_from_bias(mag);
                    }
                }
                return _nested([&] {
                    return value { tagged { hv.id, _read_any() } };
                });
            } else {
                static_assert(sizeof(T) == 0, "an unsupported header type");
            }
        }, h);
    }
}
