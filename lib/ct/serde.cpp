/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <ct/serde.hpp>

namespace cbor_turbo::serde {
    void encode_to_sink(const value &v, cbor::sink &s, const codec_options &opts)
    {
        serializer ser { s, opts.encode_depth_limit };
        ser.write(v);
        ser.flush();
    }

    uint8_vector encode(const value &v, const codec_options &opts)
    {
        uint8_vector out {};
        cbor::vector_sink s { out };
        encode_to_sink(v, s, opts);
        return out;
    }

    value decode(cbor::source &src, const shape &s, const codec_options &opts)
    {
        uint8_vector scratch(opts.scratch_size);
        auto de = decode_from_source(src, scratch, opts.recursion_limit);
        return de.read(s);
    }

    value decode(const buffer bytes, const shape &s, const codec_options &opts)
    {
        cbor::buffer_source src { bytes };
        return decode(src, s, opts);
    }
}
