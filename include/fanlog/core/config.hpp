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
 * @file config.hpp
 * @brief JSON configuration of a `Registry`.
 *
 * @details
 * A configuration document describes the registry settings and the destinations
 * to register:
 *
 * @code{.json}
 * {
 *   "enabled": true,
 *   "time_format": "yyyy-MM-dd HH:mm:ss.fff",
 *   "concurrent": true,
 *   "dispatch_timeout_ms": 0,
 *   "history": 1000,
 *   "diagnostics": false,
 *   "destinations": [
 *     {"type": "file", "id": "File", "directory": "./logs", "level": "info", "max_lines": 20},
 *     {"type": "trace", "id": "Trace"}
 *   ]
 * }
 * @endcode
 *
 * Every key is optional. The whole document is validated and every destination
 * constructed before the registry is touched, so a rejected document leaves the
 * registry unchanged.
 */

#pragma once

#include "fanlog/core/registry.hpp"
#include "fanlog/sinks/database_destination.hpp"
#include "fanlog/sinks/email_destination.hpp"
#include "fanlog/sinks/event_log_destination.hpp"

#include <filesystem>
#include <string>

namespace fanlog::core {

/**
 * @class ConfigLoader
 * @brief Applies JSON configuration documents to registries.
 *
 * The database and e-mail destinations need delivery primitives that a document
 * cannot express; register them on the loader before applying a document that
 * uses those destination types.
 */
class ConfigLoader {
  public:
    ConfigLoader();

    ConfigLoader& set_row_transport(sinks::RowTransport transport);
    ConfigLoader& set_mail_transport(sinks::MailTransport transport);

    /// @brief Channel for `event_log` destinations (`syslog_channel` by default).
    ConfigLoader& set_event_channel(sinks::EventChannel channel);

    /**
     * @brief Parses @p json_text and applies it to @p registry.
     *
     * @throws ConfigurationError on invalid JSON, a key of the wrong type, an
     * unknown destination type, an invalid destination, or a database / email
     * destination without a matching transport.
     */
    void apply(Registry& registry, const std::string& json_text) const;

    /**
     * @brief Reads @p path and applies its contents.
     * @throws ConfigurationError if the file cannot be read, or as `apply()`.
     */
    void apply_file(Registry& registry, const std::filesystem::path& path) const;

  private:
    sinks::RowTransport row_transport_;
    sinks::MailTransport mail_transport_;
    sinks::EventChannel event_channel_;
};

} // namespace fanlog::core
