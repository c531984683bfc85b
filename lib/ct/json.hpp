/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBOR_TURBO_JSON_HPP
#define CBOR_TURBO_JSON_HPP

#include <fstream>
#include <iterator>
#include <boost/json.hpp>
#include <ct/common/bytes.hpp>
#include <ct/common/error.hpp>

namespace cbor_turbo::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(static_cast<std::string_view>(buf), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open {}", path));
        const std::string raw { std::istreambuf_iterator<char> { is }, std::istreambuf_iterator<char> {} };
        if (is.bad())
            throw error_sys(fmt::format("failed to read {}", path));
        return parse(buffer { raw }, sp);
    }
}

#endif // !CBOR_TURBO_JSON_HPP
