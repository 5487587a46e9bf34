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
 * @file severity.cpp
 * @brief Severity rank, code and category tables.
 */

#include "fanlog/core/severity.hpp"

#include "fanlog/core/error.hpp"
#include "fanlog/infra/string.hpp"

namespace fanlog::core {

int rank(Severity level) noexcept
{
    return static_cast<int>(level);
}

const char* short_code(Severity level) noexcept
{
    switch (level) {
    case Severity::Debug:
        return "DBG";
    case Severity::Info:
        return "INF";
    case Severity::Warn:
        return "WRN";
    case Severity::Error:
        return "ERR";
    case Severity::Critical:
        return "CRT";
    }
    return "???";
}

EventCategory category(Severity level) noexcept
{
    switch (level) {
    case Severity::Debug:
    case Severity::Info:
        return EventCategory::Informational;
    case Severity::Warn:
        return EventCategory::Warning;
    case Severity::Error:
    case Severity::Critical:
        return EventCategory::Error;
    }
    return EventCategory::Error;
}

const char* to_string(Severity level) noexcept
{
    switch (level) {
    case Severity::Debug:
        return "Debug";
    case Severity::Info:
        return "Info";
    case Severity::Warn:
        return "Warn";
    case Severity::Error:
        return "Error";
    case Severity::Critical:
        return "Critical";
    }
    return "Unknown";
}

const char* to_string(EventCategory cat) noexcept
{
    switch (cat) {
    case EventCategory::Informational:
        return "Information";
    case EventCategory::Warning:
        return "Warning";
    case EventCategory::Error:
        return "Error";
    }
    return "Unknown";
}

Severity parse_severity(std::string_view text)
{
    const std::string key = infra::String::to_lower(infra::String::trim(std::string(text)));

    static constexpr Severity all[] = {Severity::Debug, Severity::Info, Severity::Warn,
                                       Severity::Error, Severity::Critical};
    for (Severity level : all) {
        if (key == infra::String::to_lower(to_string(level)) ||
            key == infra::String::to_lower(short_code(level))) {
            return level;
        }
    }

    // Common spellings accepted by other logging configs.
    if (key == "warning") {
        return Severity::Warn;
    }
    if (key == "fatal") {
        return Severity::Critical;
    }

    throw ConfigurationError("Unknown severity level: '" + std::string(text) + "'");
}

} // namespace fanlog::core
