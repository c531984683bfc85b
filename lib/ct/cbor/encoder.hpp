/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_CBOR_ENCODER_HPP
#define CBOR_TURBO_CBOR_ENCODER_HPP

#include <ct/common/bytes.hpp>
#include <ct/cbor/io.hpp>
#include <ct/cbor/types.hpp>

namespace cbor_turbo::cbor {
    struct encoder {
        explicit encoder(sink &s):
            _sink { s }
        {
        }

        encoder &push(const header &h);
        encoder &write_raw(buffer bytes);
        void flush();

        encoder &array()
        {
            return push(array_header {});
        }

        encoder &array(const uint64_t sz)
        {
            return push(array_header { sz });
        }

        encoder &map()
        {
            return push(map_header {});
        }

        encoder &map(const uint64_t sz)
        {
            return push(map_header { sz });
        }

        encoder &uint(const uint64_t val)
        {
            return push(positive_header { val });
        }

        // the negative value must be already converted to the uint64_t representation
        encoder &nint(const uint64_t val)
        {
            return push(negative_header { val });
        }

        encoder &float64(const double val)
        {
            return push(float_header { val });
        }

        encoder &bytes(const buffer buf)
        {
            push(bytes_header { buf.size() });
            return write_raw(buf);
        }

        encoder &text(const std::string_view sv)
        {
            push(text_header { sv.size() });
            return write_raw(sv);
        }

        encoder &tag(const uint64_t id)
        {
            return push(tag_header { id });
        }

        encoder &s_null()
        {
            return push(simple_header { simple::s_null });
        }

        encoder &s_true()
        {
            return push(simple_header { simple::s_true });
        }

        encoder &s_false()
        {
            return push(simple_header { simple::s_false });
        }

        encoder &s_break()
        {
            return push(break_header {});
        }
    private:
        sink &_sink;

        void _encode_uint_item(major_type typ, uint64_t val);
        void _encode_item(major_type typ, uint8_t special, buffer extra={});
        void _encode_float(double val);
        void _write(buffer bytes);
    };
}

#endif // !CBOR_TURBO_CBOR_ENCODER_HPP
