/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <istream>
#include <ostream>
#include <ct/cbor/io.hpp>

namespace cbor_turbo::cbor {
    stream_sink::stream_sink(std::ostream &os):
        _os { os }
    {
    }

    void stream_sink::write(const buffer bytes)
    {
        _os.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!_os) [[unlikely]]
            throw io_error(fmt::format("failed to write {} bytes to an output stream", bytes.size()));
    }

    void stream_sink::flush()
    {
        _os.flush();
        if (!_os) [[unlikely]]
            throw io_error("failed to flush an output stream");
    }

    stream_source::stream_source(std::istream &is):
        _is { is }
    {
    }

    void stream_source::read(const write_buffer out)
    {
        if (out.empty())
            return;
        _is.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(out.size()));
        const auto got = static_cast<size_t>(_is.gcount());
        _pos += got;
        if (got < out.size()) [[unlikely]] {
            if (_is.bad())
                throw io_error(fmt::format("an input stream failed at offset {}", _pos));
            throw incomplete_error { out.size() - got, _pos };
        }
    }
}
