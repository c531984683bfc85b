/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_SERDE_HPP
#define CBOR_TURBO_SERDE_HPP

#include <ct/config.hpp>
#include <ct/serde/deserializer.hpp>
#include <ct/serde/serializer.hpp>
#include <ct/serde/tag.hpp>

namespace cbor_turbo::serde {
    // flushes the sink once the value has been written
    extern void encode_to_sink(const value &v, cbor::sink &s, const codec_options &opts=codec_options::get());
    extern uint8_vector encode(const value &v, const codec_options &opts=codec_options::get());

    inline deserializer decode_from_source(cbor::source &src, const write_buffer scratch, const size_t recursion_limit=codec_options::default_recursion_limit)
    {
        return deserializer { src, scratch, recursion_limit };
    }

    // bytes past the end of the first data item are left unread
    extern value decode(cbor::source &src, const shape &s, const codec_options &opts=codec_options::get());
    extern value decode(buffer bytes, const shape &s, const codec_options &opts=codec_options::get());
}

#endif // !CBOR_TURBO_SERDE_HPP
