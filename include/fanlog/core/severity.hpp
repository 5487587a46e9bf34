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
 * @file severity.hpp
 * @brief Severity hierarchy used for every filtering decision in fanlog.
 *
 * @details
 * Declares the closed `Severity` enumeration together with its policies: the
 * numeric rank that defines the total order, the 3-letter short code printed in
 * every formatted line, and the coarse `EventCategory` used by identity-aware
 * destinations (event log, e-mail).
 */

#pragma once

#include <string>
#include <string_view>

namespace fanlog::core {

/**
 * @enum Severity
 * @brief Totally ordered classification of a log entry's importance.
 *
 * The declaration order is the filtering order: a destination configured with a
 * minimum level receives every entry whose rank is greater than or equal to it.
 */
enum class Severity {
    Debug,   ///< Interactive investigation during development. No long-term value.
    Info,    ///< General application flow. Long-term value.
    Warn,    ///< Abnormal or unexpected events that do not stop execution.
    Error,   ///< Failure of the current activity, not of the whole application.
    Critical ///< Unrecoverable crash or catastrophic failure.
};

/**
 * @enum EventCategory
 * @brief Coarse category understood by platform event channels.
 */
enum class EventCategory {
    Informational, ///< Debug and Info.
    Warning,       ///< Warn.
    Error          ///< Error and Critical.
};

/**
 * @brief Returns the position of @p level in the total order (Debug = 0).
 */
int rank(Severity level) noexcept;

/**
 * @brief Returns the 3-character code printed between brackets in a formatted line.
 *
 * `DBG`, `INF`, `WRN`, `ERR`, `CRT`.
 */
const char* short_code(Severity level) noexcept;

/**
 * @brief Maps @p level onto the coarse category used by event channels.
 */
EventCategory category(Severity level) noexcept;

/// @brief Full display name of the level ("Debug", "Info", ...).
const char* to_string(Severity level) noexcept;

/// @brief Display name of a category ("Information", "Warning", "Error").
const char* to_string(EventCategory cat) noexcept;

/**
 * @brief Parses a severity from configuration text.
 *
 * Accepts the full name or the short code, case-insensitively
 * (e.g. `"warn"`, `"WRN"`, `"Critical"`).
 *
 * @throws ConfigurationError if @p text names no severity.
 */
Severity parse_severity(std::string_view text);

/// @brief Orders two levels by rank.
inline bool at_least(Severity level, Severity minimum) noexcept
{
    return rank(level) >= rank(minimum);
}

} // namespace fanlog::core
