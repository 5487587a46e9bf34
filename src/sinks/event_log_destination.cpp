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
 * @file event_log_destination.cpp
 * @brief syslog-backed event log destination.
 */

#include "fanlog/sinks/event_log_destination.hpp"

#include "fanlog/core/error.hpp"

#include <mutex>
#include <syslog.h>

namespace fanlog::sinks {

namespace {

int to_priority(core::EventCategory category)
{
    switch (category) {
    case core::EventCategory::Informational:
        return LOG_INFO;
    case core::EventCategory::Warning:
        return LOG_WARNING;
    case core::EventCategory::Error:
        return LOG_ERR;
    }
    return LOG_ERR;
}

} // namespace

bool syslog_channel(const EventRecord& record)
{
    // openlog() keeps the ident pointer, so it must stay valid for the process.
    static const std::string ident = record.source;
    static std::once_flag opened;
    std::call_once(opened, [] { openlog(ident.c_str(), LOG_PID, LOG_USER); });

    syslog(to_priority(record.category), "%s", record.message.c_str());
    return true;
}

EventLogDestination::EventLogDestination(std::string identifier, core::Severity minimum_level,
                                         EventChannel channel, infra::ProcessIdentity identity)
    : Destination(std::move(identifier), minimum_level), channel_(std::move(channel)),
      identity_(std::move(identity))
{
    if (!channel_) {
        throw core::ConfigurationError("Event log destination requires a channel");
    }
}

std::string EventLogDestination::describe() const
{
    return identifier() + ": " + identity_.app_name;
}

void EventLogDestination::do_write(const core::LogEntry& entry)
{
    const EventRecord record{identity_.app_name, core::category(entry.level),
                             entry.formatted_body};
    if (!channel_(record)) {
        throw core::WriteFailure("Event channel rejected the entry");
    }
}

} // namespace fanlog::sinks
