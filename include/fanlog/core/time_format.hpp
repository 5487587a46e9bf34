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
 * @file time_format.hpp
 * @brief Timestamp patterns: fluent builder and renderer.
 *
 * @details
 * A time pattern is a string of field tokens and literal text. The token grammar
 * is the one understood by `render_timestamp()`:
 *
 * | Token | Meaning |
 * |---|---|
 * | `yyyy` / `yy` | 4-digit / 2-digit year |
 * | `MM` / `M` | month, zero-padded / plain |
 * | `dd` / `d` | day of month |
 * | `HH` / `H` | hour, 24-hour clock |
 * | `hh` / `h` | hour, 12-hour clock |
 * | `mm` / `m` | minute |
 * | `ss` / `s` | second |
 * | `f` .. `fffffff` | fraction of second, truncated to 1-7 digits |
 * | `tt` | `AM` / `PM` |
 * | `'text'` | quoted literal |
 * | `\c` | escaped single character |
 *
 * Every other character is copied verbatim.
 */

#pragma once

#include <chrono>
#include <string>

namespace fanlog::core {

/// @brief Pattern applied when none is configured.
inline constexpr const char* kDefaultTimeFormat = "yyyy-MM-dd HH:mm:ss.fff";

/**
 * @class TimeFormatBuilder
 * @brief Append-only fluent composer of time patterns.
 *
 * @code
 * auto pattern = fanlog::core::TimeFormatBuilder()
 *                    .day("/").month("/").year(" ")
 *                    .hour(":").minute(":").second(".").millisecond(7)
 *                    .to_pattern();   // "dd/MM/yyyy HH:mm:ss.fffffff"
 * @endcode
 */
class TimeFormatBuilder {
  public:
    TimeFormatBuilder& year(const std::string& suffix = "");
    TimeFormatBuilder& month(const std::string& suffix = "");
    TimeFormatBuilder& day(const std::string& suffix = "");
    TimeFormatBuilder& hour(const std::string& suffix = "");
    TimeFormatBuilder& minute(const std::string& suffix = "");
    TimeFormatBuilder& second(const std::string& suffix = "");

    /**
     * @brief Appends a fraction-of-second field.
     *
     * @param digits Number of fractional digits, 1 to 7 (3 = milliseconds).
     * @param suffix Literal text appended after the field.
     * @throws ConfigurationError if @p digits is outside [1,7].
     */
    TimeFormatBuilder& millisecond(int digits = 3, const std::string& suffix = "");

    /**
     * @brief Appends literal text.
     *
     * Pattern letters, quotes and backslashes in @p text are escaped so that the
     * text renders verbatim.
     */
    TimeFormatBuilder& literal(const std::string& text);

    /// @brief Resets the builder to the empty pattern.
    TimeFormatBuilder& clear();

    /// @brief Renders the accumulated pattern.
    const std::string& to_pattern() const noexcept { return pattern_; }

    bool empty() const noexcept { return pattern_.empty(); }

  private:
    TimeFormatBuilder& field(const char* token, const std::string& suffix);

    std::string pattern_;
};

/**
 * @brief Formats @p when (local time) with @p pattern.
 *
 * @param pattern A pattern following the token table above.
 * @param when The instant to render.
 * @return The rendered timestamp.
 */
std::string render_timestamp(const std::string& pattern,
                             std::chrono::system_clock::time_point when);

} // namespace fanlog::core
