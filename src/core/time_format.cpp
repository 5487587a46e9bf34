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
 * @file time_format.cpp
 * @brief Time pattern builder and token renderer.
 */

#include "fanlog/core/time_format.hpp"

#include "fanlog/core/error.hpp"

#include <cstdint>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fanlog::core {

namespace {

constexpr const char* kPatternLetters = "yMdHhmsft";

bool is_pattern_letter(char c)
{
    return c != '\0' && std::strchr(kPatternLetters, c) != nullptr;
}

std::string escape_literal(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (is_pattern_letter(c) || c == '\'' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

void append_number(std::ostringstream& out, long value, std::size_t width)
{
    out << std::setw(static_cast<int>(width)) << std::setfill('0') << value;
}

} // namespace

// ============================================================================
// TimeFormatBuilder
// ============================================================================

TimeFormatBuilder& TimeFormatBuilder::field(const char* token, const std::string& suffix)
{
    pattern_ += token;
    pattern_ += escape_literal(suffix);
    return *this;
}

TimeFormatBuilder& TimeFormatBuilder::year(const std::string& suffix)
{
    return field("yyyy", suffix);
}

TimeFormatBuilder& TimeFormatBuilder::month(const std::string& suffix)
{
    return field("MM", suffix);
}

TimeFormatBuilder& TimeFormatBuilder::day(const std::string& suffix)
{
    return field("dd", suffix);
}

TimeFormatBuilder& TimeFormatBuilder::hour(const std::string& suffix)
{
    return field("HH", suffix);
}

TimeFormatBuilder& TimeFormatBuilder::minute(const std::string& suffix)
{
    return field("mm", suffix);
}

TimeFormatBuilder& TimeFormatBuilder::second(const std::string& suffix)
{
    return field("ss", suffix);
}

TimeFormatBuilder& TimeFormatBuilder::millisecond(int digits, const std::string& suffix)
{
    if (digits < 1 || digits > 7) {
        throw ConfigurationError("Millisecond digit count " + std::to_string(digits) +
                                 " is out of range (1-7)");
    }
    return field(std::string(static_cast<std::size_t>(digits), 'f').c_str(), suffix);
}

TimeFormatBuilder& TimeFormatBuilder::literal(const std::string& text)
{
    pattern_ += escape_literal(text);
    return *this;
}

TimeFormatBuilder& TimeFormatBuilder::clear()
{
    pattern_.clear();
    return *this;
}

// ============================================================================
// Renderer
// ============================================================================

/**
 * @brief Walks the pattern once, expanding runs of identical pattern letters.
 *
 * The fraction is taken from the time point in 100 ns ticks and truncated (not
 * rounded) to the requested number of digits.
 */
std::string render_timestamp(const std::string& pattern,
                             std::chrono::system_clock::time_point when)
{
    using Ticks = std::chrono::duration<std::int64_t, std::ratio<1, 10000000>>;

    const std::time_t seconds = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::seconds>(when));
    std::tm local{};
    localtime_r(&seconds, &local);

    std::int64_t fraction =
        std::chrono::duration_cast<Ticks>(when.time_since_epoch()).count() % 10000000;
    if (fraction < 0) {
        fraction += 10000000;
    }

    std::ostringstream out;
    std::size_t i = 0;

    while (i < pattern.size()) {
        const char c = pattern[i];

        if (c == '\\') {
            if (i + 1 < pattern.size()) {
                out << pattern[i + 1];
            }
            i += 2;
            continue;
        }

        if (c == '\'') {
            const auto close = pattern.find('\'', i + 1);
            const auto end = (close == std::string::npos) ? pattern.size() : close;
            out << pattern.substr(i + 1, end - i - 1);
            i = (close == std::string::npos) ? pattern.size() : close + 1;
            continue;
        }

        if (!is_pattern_letter(c)) {
            out << c;
            ++i;
            continue;
        }

        std::size_t run = 1;
        while (i + run < pattern.size() && pattern[i + run] == c) {
            ++run;
        }
        i += run;

        switch (c) {
        case 'y': {
            const long year = local.tm_year + 1900L;
            if (run >= 3) {
                append_number(out, year, run < 4 ? 4 : run);
            } else if (run == 2) {
                append_number(out, year % 100, 2);
            } else {
                out << year % 100;
            }
            break;
        }
        case 'M':
            append_number(out, local.tm_mon + 1L, run >= 2 ? 2 : 1);
            break;
        case 'd':
            append_number(out, local.tm_mday, run >= 2 ? 2 : 1);
            break;
        case 'H':
            append_number(out, local.tm_hour, run >= 2 ? 2 : 1);
            break;
        case 'h': {
            const long hour12 = (local.tm_hour % 12 == 0) ? 12 : local.tm_hour % 12;
            append_number(out, hour12, run >= 2 ? 2 : 1);
            break;
        }
        case 'm':
            append_number(out, local.tm_min, run >= 2 ? 2 : 1);
            break;
        case 's':
            append_number(out, local.tm_sec, run >= 2 ? 2 : 1);
            break;
        case 'f': {
            const std::size_t digits = run > 7 ? 7 : run;
            std::int64_t divisor = 1;
            for (std::size_t d = digits; d < 7; ++d) {
                divisor *= 10;
            }
            append_number(out, static_cast<long>(fraction / divisor), digits);
            break;
        }
        case 't': {
            const char* marker = local.tm_hour < 12 ? "AM" : "PM";
            out << (run >= 2 ? std::string(marker) : std::string(1, marker[0]));
            break;
        }
        default:
            break;
        }
    }

    return out.str();
}

} // namespace fanlog::core
