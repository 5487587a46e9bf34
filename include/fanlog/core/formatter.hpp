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
 * @file formatter.hpp
 * @brief Conversion of payloads to display text.
 *
 * @details
 * `BodyFormatter` is the seam through which a registry turns a payload into the
 * body text of an entry. `MessageFormatter` is the default, exhaustive over every
 * `Payload` alternative. `format_line()` then composes the full timestamped line.
 */

#pragma once

#include "fanlog/core/log_entry.hpp"
#include "fanlog/core/payload.hpp"

#include <string>

namespace fanlog::core {

/**
 * @class BodyFormatter
 * @brief Converts a payload into the body text of an entry.
 */
class BodyFormatter {
  public:
    virtual ~BodyFormatter() = default;

    /**
     * @brief Renders @p payload as human-readable text.
     *
     * Called once per dispatched entry, never while the registry is disabled.
     */
    virtual std::string format_body(const Payload& payload) const = 0;
};

/**
 * @class MessageFormatter
 * @brief Default body formatter.
 *
 * **Rendering rules:**
 * - empty: `""`.
 * - error chain: one line per exception, outermost first, each ending in `\n`.
 *   Only the message text is emitted.
 * - structured command: `Command type: <kind>`, `Command text: <text>`, then one
 *   `<name>, <value>` line per parameter, each ending in `\n`.
 * - JSON document: compact JSON text.
 * - text: verbatim.
 */
class MessageFormatter : public BodyFormatter {
  public:
    std::string format_body(const Payload& payload) const override;
};

/**
 * @brief Composes `"<timestamp> [<short code>] <body>"`.
 *
 * @param entry Entry whose `formatted_body` is already set.
 * @param time_pattern Pattern applied to `entry.timestamp` (see time_format.hpp).
 */
std::string format_line(const LogEntry& entry, const std::string& time_pattern);

} // namespace fanlog::core
