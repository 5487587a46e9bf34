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
 * @file database_destination.hpp
 * @brief Tabular store destination: one row per entry.
 *
 * @details
 * The destination validates a connection descriptor at construction and turns
 * every entry into a row of the fixed `LogEntries` schema:
 *
 * | Column | Type | Content |
 * |---|---|---|
 * | `App` | text | application name |
 * | `Machine` | text | host name |
 * | `Username` | text | user name |
 * | `Timestamp` | datetime | `yyyy-MM-ddTHH:mm:ss.fff`, local time |
 * | `Level` | text | full severity name |
 * | `Category` | text | empty |
 * | `Message` | text (unbounded) | formatted body |
 *
 * The row is serialized as a JSON object and handed, together with the
 * validated descriptor, to a `RowTransport` that owns the actual connection.
 */

#pragma once

#include "fanlog/infra/identity.hpp"
#include "fanlog/sinks/destination.hpp"

#include <functional>
#include <string>

namespace fanlog::sinks {

/**
 * @struct ConnectionDescriptor
 * @brief Parsed and validated `key=value;` connection string.
 */
struct ConnectionDescriptor {
    std::string data_source;
    std::string initial_catalog;
    std::string user_id;
    std::string password;
    bool integrated_security = false;
    int connect_timeout_seconds = 2;

    /**
     * @brief Parses and validates @p text.
     *
     * Keys are case-insensitive; recognized keys and aliases:
     * `Data Source`/`Server`/`Address`, `Initial Catalog`/`Database`,
     * `User ID`/`UID`/`User`, `Password`/`PWD`,
     * `Integrated Security`/`Trusted_Connection` (`true`, `yes`, `sspi`),
     * `Connect Timeout`/`Timeout`. Unknown keys are ignored.
     *
     * Validation:
     * - data source and initial catalog are required;
     * - without integrated security, user and password must both be present or
     *   both be absent; both absent switches to integrated security.
     *
     * The connect timeout is always forced to 2 seconds.
     *
     * @throws core::ConfigurationError on any violation.
     */
    static ConnectionDescriptor parse(const std::string& text);

    /// @brief Canonical `key=value;` rendition without the password.
    std::string to_string() const;
};

/**
 * @brief Delivery primitive for serialized rows. Returns false on failure.
 *
 * @param descriptor Where to connect.
 * @param row_json One `LogEntries` row as a compact JSON object.
 */
using RowTransport =
    std::function<bool(const ConnectionDescriptor& descriptor, const std::string& row_json)>;

/**
 * @class DatabaseDestination
 * @brief Writes each entry as one row of the `LogEntries` table.
 */
class DatabaseDestination : public Destination {
  public:
    /**
     * @throws core::ConfigurationError on an empty identifier, an empty or
     * invalid connection string, or a missing transport.
     */
    DatabaseDestination(std::string identifier, const std::string& connection_string,
                        RowTransport transport,
                        core::Severity minimum_level = core::Severity::Warn,
                        infra::ProcessIdentity identity = infra::ProcessIdentity::current());

    const ConnectionDescriptor& descriptor() const noexcept { return descriptor_; }

    /// @brief Serializes @p entry to the JSON row sent to the transport.
    std::string make_row(const core::LogEntry& entry) const;

    /// @brief `"<id>: <data source>,<initial catalog>"`.
    std::string describe() const override;

  private:
    void do_write(const core::LogEntry& entry) override;

    ConnectionDescriptor descriptor_;
    RowTransport transport_;
    const infra::ProcessIdentity identity_;
};

} // namespace fanlog::sinks
