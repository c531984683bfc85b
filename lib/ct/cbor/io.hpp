/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_CBOR_IO_HPP
#define CBOR_TURBO_CBOR_IO_HPP

#include <iosfwd>
#include <optional>
#include <ct/common/bytes.hpp>
#include <ct/cbor/error.hpp>

namespace cbor_turbo::cbor {
    struct sink {
        virtual ~sink() =default;
        virtual void write(buffer bytes) =0;
        virtual void flush() {}
    };

    struct source {
        virtual ~source() =default;
        // fills the whole output buffer or throws incomplete_error
        virtual void read(write_buffer out) =0;

        // a view of the next sz bytes that stays valid while the source lives
        virtual std::optional<buffer> borrow(size_t /*sz*/)
        {
            return {};
        }
    };

    struct vector_sink: sink {
        explicit vector_sink(uint8_vector &out):
            _out { out }
        {
        }

        void write(const buffer bytes) override
        {
            _out << bytes;
        }
    private:
        uint8_vector &_out;
    };

    struct stream_sink: sink {
        explicit stream_sink(std::ostream &os);
        void write(buffer bytes) override;
        void flush() override;
    private:
        std::ostream &_os;
    };

    struct buffer_source: source {
        explicit buffer_source(const buffer bytes):
            _bytes { bytes }
        {
        }

        void read(const write_buffer out) override
        {
            const auto bytes = borrow(out.size());
            if (!bytes->empty())
                memcpy(out.data(), bytes->data(), bytes->size());
        }

        std::optional<buffer> borrow(const size_t sz) override
        {
            if (sz > _bytes.size() - _pos) [[unlikely]]
                throw incomplete_error { sz - (_bytes.size() - _pos), _pos };
            const auto res = _bytes.subbuf(_pos, sz);
            _pos += sz;
            return res;
        }

        size_t position() const noexcept
        {
            return _pos;
        }

        size_t remaining() const noexcept
        {
            return _bytes.size() - _pos;
        }
    private:
        buffer _bytes;
        size_t _pos = 0;
    };

    struct stream_source: source {
        explicit stream_source(std::istream &is);
        void read(write_buffer out) override;
    private:
        std::istream &_is;
        size_t _pos = 0;
    };
}

#endif // !CBOR_TURBO_CBOR_IO_HPP
