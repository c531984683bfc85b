/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_CBOR_ERROR_HPP
#define CBOR_TURBO_CBOR_ERROR_HPP

#include <ct/common/error.hpp>
#include <ct/common/format.hpp>

namespace cbor_turbo::cbor {
    struct io_error: error {
        using error::error;
    };

    struct incomplete_error: io_error {
        explicit incomplete_error(const size_t needed, const size_t offset):
            io_error { fmt::format("unexpected end of input: needed {} more bytes at offset {}", needed, offset) },
            _needed { needed }, _offset { offset }
        {
        }

        size_t needed() const noexcept
        {
            return _needed;
        }

        size_t offset() const noexcept
        {
            return _offset;
        }
    private:
        size_t _needed;
        size_t _offset;
    };

    struct syntax_error: error {
        explicit syntax_error(const size_t offset, const std::string_view msg):
            error { fmt::format("CBOR syntax error at offset {}: {}", offset, msg) },
            _offset { offset }
        {
        }

        size_t offset() const noexcept
        {
            return _offset;
        }
    private:
        size_t _offset;
    };

    struct value_error: error {
        using error::error;
    };

    struct recursion_limit_error: error {
        explicit recursion_limit_error(const size_t limit):
            error { fmt::format("the recursion limit of {} has been exceeded", limit) }
        {
        }
    };
}

#endif // !CBOR_TURBO_CBOR_ERROR_HPP
