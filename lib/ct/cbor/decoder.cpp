/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <array>
#include <limits>
#include <vector>
#include <cstring>
#include <ct/cbor/decoder.hpp>
#include <ct/cbor/half.hpp>

namespace cbor_turbo::cbor {
    header decoder::pull()
    {
        if (_pushed) {
            const auto h = *_pushed;
            _pushed.reset();
            return h;
        }
        _header_offset = _offset;
        uint8_t initial;
        _read(write_buffer { &initial, 1 });
        const auto typ = static_cast<major_type>(initial >> 5);
        const uint8_t info = initial & 0x1F;
        std::optional<uint64_t> arg {};
        switch (info) {
            case static_cast<uint8_t>(special_val::one_byte): arg = _read_uint(1); break;
            case static_cast<uint8_t>(special_val::two_bytes): arg = _read_uint(2); break;
            case static_cast<uint8_t>(special_val::four_bytes): arg = _read_uint(4); break;
            case static_cast<uint8_t>(special_val::eight_bytes): arg = _read_uint(8); break;
            case static_cast<uint8_t>(special_val::s_break): break;
            default:
                if (info >= 24) [[unlikely]]
                    throw syntax_error(_header_offset, fmt::format("reserved additional information value {}", info));
                arg = info;
                break;
        }
        switch (typ) {
            case major_type::uint:
                if (!arg) [[unlikely]]
                    throw syntax_error(_header_offset, "an indefinite-length positive integer");
                return positive_header { *arg };
            case major_type::nint:
                if (!arg) [[unlikely]]
                    throw syntax_error(_header_offset, "an indefinite-length negative integer");
                return negative_header { *arg };
            case major_type::bytes:
                return bytes_header { arg };
            case major_type::text:
                return text_header { arg };
            case major_type::array:
                return array_header { arg };
            case major_type::map:
                return map_header { arg };
            case major_type::tag:
                if (!arg) [[unlikely]]
                    throw syntax_error(_header_offset, "an indefinite-length tag");
                return tag_header { *arg };
            case major_type::simple:
                switch (info) {
                    case static_cast<uint8_t>(special_val::one_byte):
                        if (*arg < 32) [[unlikely]]
                            throw syntax_error(_header_offset, fmt::format("simple value {} in the one-byte form", *arg));
                        return simple_header { static_cast<uint8_t>(*arg) };
                    case static_cast<uint8_t>(special_val::two_bytes):
                        return float_header { half::to_double(static_cast<uint16_t>(*arg)) };
                    case static_cast<uint8_t>(special_val::four_bytes): {
                        const auto bits = static_cast<uint32_t>(*arg);
                        float f;
                        memcpy(&f, &bits, sizeof(f));
                        return float_header { static_cast<double>(f) };
                    }
                    case static_cast<uint8_t>(special_val::eight_bytes): {
                        const uint64_t bits = *arg;
                        double d;
                        memcpy(&d, &bits, sizeof(d));
                        return float_header { d };
                    }
                    case static_cast<uint8_t>(special_val::s_break):
                        return break_header {};
                    default:
                        return simple_header { info };
                }
            default:
                throw error(fmt::format("unsupported major type: {}", typ));
        }
    }

    void decoder::push(const header &h)
    {
        if (_pushed) [[unlikely]]
            throw error(fmt::format("a header has already been pushed back: {}", *_pushed));
        _pushed = h;
    }

    void decoder::read_exact(const write_buffer out)
    {
        if (_pushed) [[unlikely]]
            throw error("raw bytes can not be read while a pushed-back header is pending");
        _read(out);
    }

    std::optional<buffer> decoder::borrow(const size_t sz)
    {
        if (_pushed) [[unlikely]]
            throw error("raw bytes can not be borrowed while a pushed-back header is pending");
        std::optional<buffer> res {};
        try {
            res = _src.borrow(sz);
        } catch (const error &) {
            throw;
        } catch (const std::exception &ex) {
            throw io_error(fmt::format("source borrow of {} bytes failed", sz), ex);
        }
        if (res)
            _offset += res->size();
        return res;
    }

    void decoder::skip()
    {
        // the number of data items that remain to be skipped, std::nullopt means until a break
        std::vector<std::optional<uint64_t>> todo {};
        todo.emplace_back(1);
        while (!todo.empty()) {
            auto &left = todo.back();
            if (left && *left == 0) {
                todo.pop_back();
                continue;
            }
            const auto h = pull();
            if (std::holds_alternative<break_header>(h)) {
                if (left) [[unlikely]]
                    throw syntax_error(_header_offset, "an unexpected break");
                todo.pop_back();
                continue;
            }
            if (left)
                --*left;
            std::visit([&](const auto &hv) {
                using T = std::decay_t<decltype(hv)>;
                if constexpr (std::is_same_v<T, bytes_header> || std::is_same_v<T, text_header>) {
                    if (hv.len) {
                        _skip_bytes(*hv.len);
                    } else {
                        for (;;) {
                            const auto chunk = pull();
                            if (std::holds_alternative<break_header>(chunk))
                                break;
                            const auto *chunk_h = std::get_if<T>(&chunk);
                            if (!chunk_h || !chunk_h->len) [[unlikely]]
                                throw syntax_error(_header_offset, fmt::format("an invalid chunk of an indefinite {}: {}", header_name(h), chunk));
                            _skip_bytes(*chunk_h->len);
                        }
                    }
                } else if constexpr (std::is_same_v<T, array_header>) {
                    todo.emplace_back(hv.len);
                } else if constexpr (std::is_same_v<T, map_header>) {
                    if (hv.len) {
                        if (*hv.len > std::numeric_limits<uint64_t>::max() / 2) [[unlikely]]
                            throw syntax_error(_header_offset, fmt::format("a map of {} entries is too large", *hv.len));
                        todo.emplace_back(*hv.len * 2);
                    } else {
                        todo.emplace_back();
                    }
                } else if constexpr (std::is_same_v<T, tag_header>) {
                    todo.emplace_back(1);
                }
            }, h);
        }
    }

    uint64_t decoder::_read_uint(const size_t sz)
    {
        std::array<uint8_t, sizeof(uint64_t)> bytes {};
        _read(write_buffer { bytes.data(), sz });
        uint64_t val = 0;
        for (size_t i = 0; i < sz; ++i)
            val = (val << 8) | bytes[i];
        return val;
    }

    void decoder::_read(const write_buffer out)
    {
        try {
            _src.read(out);
        } catch (const error &) {
            throw;
        } catch (const std::exception &ex) {
            throw io_error(fmt::format("source read of {} bytes at offset {} failed", out.size(), _offset), ex);
        }
        _offset += out.size();
    }

    void decoder::_skip_bytes(uint64_t sz)
    {
        std::array<uint8_t, 0x1000> buf;
        while (sz > 0) {
            const auto chunk_sz = static_cast<size_t>(std::min<uint64_t>(sz, buf.size()));
            _read(write_buffer { buf.data(), chunk_sz });
            sz -= chunk_sz;
        }
    }
}
