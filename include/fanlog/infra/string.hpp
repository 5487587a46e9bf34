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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` used by the configuration paths of fanlog: severity names,
 * connection descriptors and file-name patterns.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fanlog::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * Whitespace is whatever `std::isspace` classifies as such in the "C" locale
     * (space, `\t`, `\n`, `\r`, `\v`, `\f`).
     *
     * @param s The source string to process.
     * @return A new string without the surrounding whitespace. Empty if @p s is
     * empty or consists solely of whitespace.
     *
     * @code
     * std::string key = fanlog::infra::String::trim("  Data Source ");  // "Data Source"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII lower-case copy of @p s.
    static std::string to_lower(std::string s);

    /**
     * @brief Splits @p s on every occurrence of @p delimiter.
     *
     * Empty fields are kept, so `"a;;b"` yields `{"a", "", "b"}`.
     */
    static std::vector<std::string> split(const std::string& s, char delimiter);

    /// @brief Case-insensitive ASCII comparison.
    static bool iequals(std::string_view a, std::string_view b);

    static bool starts_with(std::string_view s, std::string_view prefix);
    static bool ends_with(std::string_view s, std::string_view suffix);
};

} // namespace fanlog::infra
