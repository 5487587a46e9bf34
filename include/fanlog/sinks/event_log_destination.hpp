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
 * @file event_log_destination.hpp
 * @brief Platform event log destination (syslog on POSIX).
 */

#pragma once

#include "fanlog/infra/identity.hpp"
#include "fanlog/sinks/destination.hpp"

#include <functional>
#include <string>

namespace fanlog::sinks {

/**
 * @struct EventRecord
 * @brief What the event log destination hands to its channel.
 */
struct EventRecord {
    std::string source;           ///< Application name of the process.
    core::EventCategory category; ///< Coarse category of the entry's severity.
    std::string message;          ///< Formatted body (no timestamp or level).
};

/**
 * @brief Delivery primitive of the event log destination. Returns false on failure.
 */
using EventChannel = std::function<bool(const EventRecord&)>;

/**
 * @brief Default channel: `syslog(3)` with facility `LOG_USER`.
 *
 * Categories map to priorities `LOG_INFO`, `LOG_WARNING` and `LOG_ERR`.
 *
 * `openlog()` is process-wide: the ident is taken from the `source` of the
 * first record this channel sees and stays fixed for the life of the process.
 * Records from later registries or identities carry the same ident; supply a
 * custom channel when each source must be tagged separately.
 */
bool syslog_channel(const EventRecord& record);

/**
 * @class EventLogDestination
 * @brief Forwards entries to the platform event log.
 */
class EventLogDestination : public Destination {
  public:
    /**
     * @param identifier Registry key.
     * @param minimum_level Lowest severity written.
     * @param channel Delivery primitive; `syslog_channel` by default.
     * @param identity Source stamped on every record.
     */
    explicit EventLogDestination(std::string identifier,
                                 core::Severity minimum_level = core::Severity::Error,
                                 EventChannel channel = syslog_channel,
                                 infra::ProcessIdentity identity = infra::ProcessIdentity::current());

    std::string describe() const override;

  private:
    void do_write(const core::LogEntry& entry) override;

    EventChannel channel_;
    const infra::ProcessIdentity identity_;
};

} // namespace fanlog::sinks
