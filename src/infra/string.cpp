/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 *
 * @details
 * All routines operate on bytes and treat only ASCII specially, which is all the
 * configuration grammar of fanlog needs.
 */

#include "fanlog/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace fanlog::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The `static_cast<unsigned char>` avoids undefined behavior in
 * `std::isspace` for bytes with the high bit set on signed-char platforms.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> String::split(const std::string& s, char delimiter)
{
    std::vector<std::string> fields;
    std::string::size_type begin = 0;

    while (true) {
        const auto pos = s.find(delimiter, begin);
        if (pos == std::string::npos) {
            fields.push_back(s.substr(begin));
            break;
        }
        fields.push_back(s.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return fields;
}

bool String::iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool String::starts_with(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool String::ends_with(std::string_view s, std::string_view suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace fanlog::infra
