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
 * @file database_destination.cpp
 * @brief Connection descriptor validation and row serialization.
 *
 * @details
 * Rows are built as cJSON objects and printed unformatted; the transport receives
 * a self-contained JSON document per entry.
 */

#include "fanlog/sinks/database_destination.hpp"

#include "fanlog/core/error.hpp"
#include "fanlog/core/time_format.hpp"
#include "fanlog/infra/string.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <initializer_list>

namespace fanlog::sinks {

namespace {

constexpr int kConnectTimeoutSeconds = 2;

bool is_key(const std::string& key, std::initializer_list<const char*> names)
{
    for (const char* name : names) {
        if (infra::String::iequals(key, name)) {
            return true;
        }
    }
    return false;
}

bool parse_flag(const std::string& value)
{
    const std::string v = infra::String::to_lower(value);
    return v == "true" || v == "yes" || v == "sspi" || v == "1";
}

} // namespace

// ============================================================================
// ConnectionDescriptor
// ============================================================================

ConnectionDescriptor ConnectionDescriptor::parse(const std::string& text)
{
    if (infra::String::trim(text).empty()) {
        throw core::ConfigurationError("Connection string cannot be empty");
    }

    ConnectionDescriptor d;

    for (const auto& field : infra::String::split(text, ';')) {
        if (infra::String::trim(field).empty()) {
            continue;
        }

        const auto eq = field.find('=');
        if (eq == std::string::npos) {
            throw core::ConfigurationError("Invalid connection string segment: '" + field + "'");
        }

        const std::string key = infra::String::trim(field.substr(0, eq));
        const std::string value = infra::String::trim(field.substr(eq + 1));

        if (is_key(key, {"Data Source", "Server", "Address"})) {
            d.data_source = value;
        } else if (is_key(key, {"Initial Catalog", "Database"})) {
            d.initial_catalog = value;
        } else if (is_key(key, {"User ID", "UID", "User"})) {
            d.user_id = value;
        } else if (is_key(key, {"Password", "PWD"})) {
            d.password = value;
        } else if (is_key(key, {"Integrated Security", "Trusted_Connection"})) {
            d.integrated_security = parse_flag(value);
        }
        // Connect Timeout and unknown keys are accepted and ignored.
    }

    if (d.data_source.empty() || d.initial_catalog.empty()) {
        throw core::ConfigurationError("Invalid connection string. The Data Source and Initial "
                                       "Catalog properties must be specified.");
    }

    if (!d.integrated_security) {
        if (d.user_id.empty() != d.password.empty()) {
            throw core::ConfigurationError(
                "Invalid connection string. User ID or Password is missing.");
        }
        if (d.user_id.empty() && d.password.empty()) {
            d.integrated_security = true;
        }
    }

    d.connect_timeout_seconds = kConnectTimeoutSeconds;
    return d;
}

std::string ConnectionDescriptor::to_string() const
{
    std::string out = "Data Source=" + data_source + ";Initial Catalog=" + initial_catalog + ";";
    if (integrated_security) {
        out += "Integrated Security=true;";
    } else {
        out += "User ID=" + user_id + ";";
    }
    out += "Connect Timeout=" + std::to_string(connect_timeout_seconds) + ";";
    return out;
}

// ============================================================================
// DatabaseDestination
// ============================================================================

DatabaseDestination::DatabaseDestination(std::string identifier,
                                         const std::string& connection_string,
                                         RowTransport transport, core::Severity minimum_level,
                                         infra::ProcessIdentity identity)
    : Destination(std::move(identifier), minimum_level),
      descriptor_(ConnectionDescriptor::parse(connection_string)),
      transport_(std::move(transport)), identity_(std::move(identity))
{
    if (!transport_) {
        throw core::ConfigurationError("Database destination requires a row transport");
    }
}

std::string DatabaseDestination::make_row(const core::LogEntry& entry) const
{
    cJSON* row = cJSON_CreateObject();
    if (!row) {
        throw core::WriteFailure("Out of memory while building row");
    }

    const std::string timestamp =
        core::render_timestamp("yyyy-MM-dd'T'HH:mm:ss.fff", entry.timestamp);

    cJSON_AddStringToObject(row, "App", identity_.app_name.c_str());
    cJSON_AddStringToObject(row, "Machine", identity_.machine_name.c_str());
    cJSON_AddStringToObject(row, "Username", identity_.user_name.c_str());
    cJSON_AddStringToObject(row, "Timestamp", timestamp.c_str());
    cJSON_AddStringToObject(row, "Level", core::to_string(entry.level));
    cJSON_AddStringToObject(row, "Category", "");
    cJSON_AddStringToObject(row, "Message", entry.formatted_body.c_str());

    char* raw = cJSON_PrintUnformatted(row);
    cJSON_Delete(row);
    if (!raw) {
        throw core::WriteFailure("Row serialization failed");
    }

    std::string json(raw);
    free(raw);
    return json;
}

std::string DatabaseDestination::describe() const
{
    return identifier() + ": " + descriptor_.data_source + "," + descriptor_.initial_catalog;
}

void DatabaseDestination::do_write(const core::LogEntry& entry)
{
    if (!transport_(descriptor_, make_row(entry))) {
        throw core::WriteFailure("Row transport to '" + descriptor_.data_source + "' failed");
    }
}

} // namespace fanlog::sinks
