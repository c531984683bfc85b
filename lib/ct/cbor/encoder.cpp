/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <array>
#include <cmath>
#include <cstring>
#include <limits>
#include <ct/cbor/encoder.hpp>
#include <ct/cbor/half.hpp>

namespace cbor_turbo::cbor {
    encoder &encoder::push(const header &h)
    {
        std::visit([&](const auto &hv) {
            using T = std::decay_t<decltype(hv)>;
            if constexpr (std::is_same_v<T, positive_header>) {
                _encode_uint_item(major_type::uint, hv.val);
            } else if constexpr (std::is_same_v<T, negative_header>) {
                _encode_uint_item(major_type::nint, hv.bias);
            } else if constexpr (std::is_same_v<T, float_header>) {
                _encode_float(hv.val);
            } else if constexpr (std::is_same_v<T, simple_header>) {
                if (hv.code < 24) {
                    _encode_item(major_type::simple, hv.code);
                } else if (hv.code >= 32) {
                    _encode_item(major_type::simple, static_cast<uint8_t>(special_val::one_byte), buffer { &hv.code, 1 });
                } else {
                    throw value_error(fmt::format("simple value {} has no valid encoding", hv.code));
                }
            } else if constexpr (std::is_same_v<T, tag_header>) {
                _encode_uint_item(major_type::tag, hv.id);
            } else if constexpr (std::is_same_v<T, break_header>) {
                _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_break));
            } else {
                const auto typ = header_major_type(h);
                if (hv.len)
                    _encode_uint_item(typ, *hv.len);
                else
                    _encode_item(typ, static_cast<uint8_t>(special_val::s_break));
            }
        }, h);
        return *this;
    }

    encoder &encoder::write_raw(const buffer bytes)
    {
        if (!bytes.empty())
            _write(bytes);
        return *this;
    }

    void encoder::flush()
    {
        try {
            _sink.flush();
        } catch (const error &) {
            throw;
        } catch (const std::exception &ex) {
            throw io_error("sink flush failed", ex);
        }
    }

    void encoder::_encode_uint_item(const major_type typ, const uint64_t val)
    {
        if (val < 24) {
            _encode_item(typ, static_cast<uint8_t>(val));
        } else if (val <= std::numeric_limits<uint8_t>::max()) {
            const auto h_val = static_cast<uint8_t>(val);
            _encode_item(typ, static_cast<uint8_t>(special_val::one_byte), buffer { &h_val, sizeof(h_val) });
        } else if (val <= std::numeric_limits<uint16_t>::max()) {
            const auto h_val = host_to_net<uint16_t>(static_cast<uint16_t>(val));
            _encode_item(typ, static_cast<uint8_t>(special_val::two_bytes), buffer::from(h_val));
        } else if (val <= std::numeric_limits<uint32_t>::max()) {
            const auto h_val = host_to_net<uint32_t>(static_cast<uint32_t>(val));
            _encode_item(typ, static_cast<uint8_t>(special_val::four_bytes), buffer::from(h_val));
        } else {
            const auto h_val = host_to_net<uint64_t>(val);
            _encode_item(typ, static_cast<uint8_t>(special_val::eight_bytes), buffer::from(h_val));
        }
    }

    void encoder::_encode_float(const double val)
    {
        if (std::isnan(val)) {
            const auto h_val = host_to_net<uint16_t>(half::canonical_nan);
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::two_bytes), buffer::from(h_val));
        } else if (const auto h = half::from_double(val); h) {
            const auto h_val = host_to_net<uint16_t>(*h);
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::two_bytes), buffer::from(h_val));
        } else if (std::fabs(val) <= std::numeric_limits<float>::max() && static_cast<double>(static_cast<float>(val)) == val) {
            const auto f = static_cast<float>(val);
            uint32_t bits;
            memcpy(&bits, &f, sizeof(bits));
            const auto h_val = host_to_net<uint32_t>(bits);
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::four_bytes), buffer::from(h_val));
        } else {
            uint64_t bits;
            memcpy(&bits, &val, sizeof(bits));
            const auto h_val = host_to_net<uint64_t>(bits);
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::eight_bytes), buffer::from(h_val));
        }
    }

    void encoder::_encode_item(const major_type typ, const uint8_t special, const buffer extra)
    {
        std::array<uint8_t, 9> hdr {};
        hdr[0] = (static_cast<uint8_t>(typ) << 5) | (special & 0x1F);
        if (extra.size() >= hdr.size()) [[unlikely]]
            throw error(fmt::format("a header argument can not be {} bytes long", extra.size()));
        if (!extra.empty())
            memcpy(hdr.data() + 1, extra.data(), extra.size());
        _write(buffer { hdr.data(), 1 + extra.size() });
    }

    void encoder::_write(const buffer bytes)
    {
        try {
            _sink.write(bytes);
        } catch (const error &) {
            throw;
        } catch (const std::exception &ex) {
            throw io_error(fmt::format("sink write of {} bytes failed", bytes.size()), ex);
        }
    }
}
