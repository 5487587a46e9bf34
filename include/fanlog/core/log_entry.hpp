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
 * @file log_entry.hpp
 * @brief One log call, as seen by destinations.
 */

#pragma once

#include "fanlog/core/payload.hpp"
#include "fanlog/core/severity.hpp"

#include <chrono>
#include <string>

namespace fanlog::core {

/**
 * @struct LogEntry
 * @brief Timestamped, leveled payload plus its formatted renditions.
 *
 * The registry fills `formatted_body` and `full_line` exactly once, before the
 * fan-out; destinations only read them. After dispatch the entry is discarded
 * (it outlives the call only while a timed-out write is still running).
 */
struct LogEntry {
    LogEntry(Severity lvl, Payload msg)
        : timestamp(std::chrono::system_clock::now()), level(lvl), payload(std::move(msg))
    {
    }

    const std::chrono::system_clock::time_point timestamp;
    const Severity level;
    const Payload payload;

    /// @brief Payload text without timestamp or level (database, e-mail, event log).
    std::string formatted_body;

    /// @brief `"<timestamp> [<code>] <body>"` (file, console, trace, history).
    std::string full_line;
};

} // namespace fanlog::core
