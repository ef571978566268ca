/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_COMMON_JSON_HPP
#define TESSERA_COMMON_JSON_HPP

#include <fstream>
#include <iterator>
#include <boost/json.hpp>
#include <tessera/common/bytes.hpp>
#include <tessera/common/format.hpp>

namespace tessera::json {
    using namespace boost::json;

    inline json::value parse(const std::string_view text, json::storage_ptr sp={})
    {
        try {
            return boost::json::parse(text, sp);
        } catch (const std::exception &ex) {
            throw tessera::error("failed to parse a json document", ex);
        }
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw tessera::error(fmt::format("failed to open a json file: {}", path));
        const std::string text { std::istreambuf_iterator<char> { is }, std::istreambuf_iterator<char> {} };
        if (is.bad())
            throw tessera::error(fmt::format("failed to read a json file: {}", path));
        return parse(text, sp);
    }
}

#endif // !TESSERA_COMMON_JSON_HPP
