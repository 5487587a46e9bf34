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
 * @file config.cpp
 * @brief cJSON-based configuration loader.
 *
 * @details
 * Loading runs in two phases:
 * 1. **Build**: parse the document, type-check every key, and construct every
 *    destination. Any failure throws before the registry is modified.
 * 2. **Commit**: apply settings and register the destinations in document order.
 */

#include "fanlog/core/config.hpp"

#include "fanlog/core/error.hpp"
#include "fanlog/infra/logger.hpp"
#include "fanlog/infra/string.hpp"
#include "fanlog/sinks/console_destination.hpp"
#include "fanlog/sinks/file_destination.hpp"

#include <algorithm>
#include <cJSON.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <vector>

namespace fanlog::core {

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

// ============================================================================
// Typed accessors. Absent keys yield nullopt; present keys of the wrong type throw.
// ============================================================================

std::optional<bool> get_bool(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!item) {
        return std::nullopt;
    }
    if (!cJSON_IsBool(item)) {
        throw ConfigurationError(std::string("'") + key + "' must be a boolean");
    }
    return cJSON_IsTrue(item) != 0;
}

std::optional<std::string> get_string(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!item) {
        return std::nullopt;
    }
    if (!cJSON_IsString(item) || !item->valuestring) {
        throw ConfigurationError(std::string("'") + key + "' must be a string");
    }
    return std::string(item->valuestring);
}

constexpr std::uint64_t kMaxPort = 65535;

/// @brief Largest integer a JSON number (an IEEE double) holds exactly.
constexpr std::uint64_t kExactIntegerLimit = 9007199254740992ULL; // 2^53

std::optional<std::uint64_t> get_count(const cJSON* obj, const char* key,
                                       std::uint64_t max = kExactIntegerLimit)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!item) {
        return std::nullopt;
    }
    if (!cJSON_IsNumber(item) || item->valuedouble < 0 ||
        item->valuedouble != std::floor(item->valuedouble)) {
        throw ConfigurationError(std::string("'") + key + "' must be a non-negative integer");
    }
    const std::uint64_t limit = std::min(max, kExactIntegerLimit);
    if (item->valuedouble > static_cast<double>(limit)) {
        throw ConfigurationError(std::string("'") + key + "' must not exceed " +
                                 std::to_string(limit));
    }
    return static_cast<std::uint64_t>(item->valuedouble);
}

std::vector<std::string> get_string_list(const cJSON* obj, const char* key)
{
    std::vector<std::string> values;

    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!item) {
        return values;
    }
    if (!cJSON_IsArray(item)) {
        throw ConfigurationError(std::string("'") + key + "' must be an array of strings");
    }

    const cJSON* element = nullptr;
    cJSON_ArrayForEach(element, item)
    {
        if (!cJSON_IsString(element) || !element->valuestring) {
            throw ConfigurationError(std::string("'") + key + "' must be an array of strings");
        }
        values.emplace_back(element->valuestring);
    }
    return values;
}

std::string require_string(const cJSON* obj, const char* key, const std::string& where)
{
    auto value = get_string(obj, key);
    if (!value || infra::String::trim(*value).empty()) {
        throw ConfigurationError(where + ": '" + key + "' is required");
    }
    return *value;
}

/**
 * @struct PendingDestination
 * @brief A constructed destination plus the flags applied at commit time.
 */
struct PendingDestination {
    std::shared_ptr<sinks::Destination> destination;
    bool enabled = true;
};

} // namespace

ConfigLoader::ConfigLoader() : event_channel_(sinks::syslog_channel) {}

ConfigLoader& ConfigLoader::set_row_transport(sinks::RowTransport transport)
{
    row_transport_ = std::move(transport);
    return *this;
}

ConfigLoader& ConfigLoader::set_mail_transport(sinks::MailTransport transport)
{
    mail_transport_ = std::move(transport);
    return *this;
}

ConfigLoader& ConfigLoader::set_event_channel(sinks::EventChannel channel)
{
    if (!channel) {
        throw ConfigurationError("Event channel cannot be null");
    }
    event_channel_ = std::move(channel);
    return *this;
}

void ConfigLoader::apply(Registry& registry, const std::string& json_text) const
{
    JsonPtr root(cJSON_Parse(json_text.c_str()), cJSON_Delete);
    if (!root) {
        throw ConfigurationError("Invalid JSON syntax in configuration");
    }
    if (!cJSON_IsObject(root.get())) {
        throw ConfigurationError("Configuration root must be a JSON object");
    }

    const cJSON* cfg = root.get();

    // --- 1. Build phase ---
    const auto enabled = get_bool(cfg, "enabled");
    const auto concurrent = get_bool(cfg, "concurrent");
    const auto diagnostics = get_bool(cfg, "diagnostics");
    const auto time_format = get_string(cfg, "time_format");
    const auto timeout_ms = get_count(cfg, "dispatch_timeout_ms");
    const auto history = get_count(cfg, "history", std::numeric_limits<std::size_t>::max());

    if (time_format && time_format->empty()) {
        throw ConfigurationError("'time_format' cannot be empty");
    }

    std::vector<PendingDestination> pending;

    const cJSON* list = cJSON_GetObjectItemCaseSensitive(cfg, "destinations");
    if (list && !cJSON_IsArray(list)) {
        throw ConfigurationError("'destinations' must be an array");
    }

    const cJSON* node = nullptr;
    cJSON_ArrayForEach(node, list)
    {
        if (!cJSON_IsObject(node)) {
            throw ConfigurationError("Each destination must be a JSON object");
        }

        const std::string type = infra::String::to_lower(require_string(node, "type", "destination"));
        const std::string id = require_string(node, "id", type + " destination");
        const auto level_text = get_string(node, "level");
        const std::string where = "destination '" + id + "'";

        std::optional<Severity> level;
        if (level_text) {
            level = parse_severity(*level_text);
        }

        PendingDestination entry;
        entry.enabled = get_bool(node, "enabled").value_or(true);

        if (type == "file") {
            auto file = std::make_shared<sinks::FileDestination>(
                id, get_string(node, "directory"), get_string(node, "name"),
                level.value_or(Severity::Info));
            file->set_max_lines(static_cast<std::size_t>(
                get_count(node, "max_lines", std::numeric_limits<std::size_t>::max()).value_or(0)));
            file->set_max_bytes(get_count(node, "max_bytes").value_or(0));
            entry.destination = std::move(file);
        } else if (type == "console") {
            if (!sinks::ConsoleDestination::interactive()) {
                infra::Logger::log(Severity::Info,
                                   "Config: skipping " + where + ", stdout is not a terminal");
                continue;
            }
            entry.destination =
                std::make_shared<sinks::ConsoleDestination>(id, level.value_or(Severity::Debug));
        } else if (type == "trace") {
            entry.destination =
                std::make_shared<sinks::TraceDestination>(id, level.value_or(Severity::Debug));
        } else if (type == "event_log") {
            entry.destination = std::make_shared<sinks::EventLogDestination>(
                id, level.value_or(Severity::Error), event_channel_);
        } else if (type == "database") {
            if (!row_transport_) {
                throw ConfigurationError(where + ": no row transport registered");
            }
            entry.destination = std::make_shared<sinks::DatabaseDestination>(
                id, require_string(node, "connection", where), row_transport_,
                level.value_or(Severity::Warn));
        } else if (type == "email") {
            if (!mail_transport_) {
                throw ConfigurationError(where + ": no mail transport registered");
            }
            sinks::MailSettings settings;
            settings.smtp_server = get_string(node, "smtp_server").value_or("");
            settings.smtp_port =
                static_cast<int>(get_count(node, "smtp_port", kMaxPort).value_or(25));
            settings.sender = get_string(node, "sender").value_or("");
            settings.recipients = get_string_list(node, "recipients");
            entry.destination = std::make_shared<sinks::EmailDestination>(
                id, std::move(settings), mail_transport_, level.value_or(Severity::Critical));
        } else {
            throw ConfigurationError(where + ": unknown destination type '" + type + "'");
        }

        pending.push_back(std::move(entry));
    }

    // --- 2. Commit phase ---
    if (diagnostics) {
        infra::Logger::set_enabled(*diagnostics);
    }
    if (enabled) {
        registry.set_global_enabled(*enabled);
    }
    if (concurrent) {
        registry.set_concurrent_dispatch(*concurrent);
    }
    if (time_format) {
        registry.set_time_format(*time_format);
    }
    if (timeout_ms) {
        registry.set_dispatch_timeout(std::chrono::milliseconds(*timeout_ms));
    }
    if (history && *history > 0) {
        registry.enable_history(static_cast<std::size_t>(*history));
    }

    for (auto& entry : pending) {
        entry.destination->set_enabled(entry.enabled);
        registry.add_or_replace(std::move(entry.destination));
    }

    infra::Logger::log(Severity::Info, "Config: " + std::to_string(pending.size()) +
                                           " destination(s) registered");
}

void ConfigLoader::apply_file(Registry& registry, const std::filesystem::path& path) const
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigurationError("Cannot open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    apply(registry, buffer.str());
}

} // namespace fanlog::core
