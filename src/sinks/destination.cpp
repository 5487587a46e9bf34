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
 * @file destination.cpp
 * @brief Destination base class and the attempt policy.
 */

#include "fanlog/sinks/destination.hpp"

#include "fanlog/core/error.hpp"
#include "fanlog/infra/logger.hpp"

namespace fanlog::sinks {

AttemptResult attempt(const std::string& context, const std::function<void()>& operation) noexcept
{
    try {
        operation();
        return AttemptResult::Ok;
    } catch (const std::exception& e) {
        try {
            infra::Logger::log(core::Severity::Warn,
                               context + ": write discarded: " + std::string(e.what()));
        } catch (const std::exception&) {
            // The diagnostics stream itself failed; the policy still holds.
        }
    } catch (...) {
        try {
            infra::Logger::log(core::Severity::Warn, context + ": write discarded: unknown error");
        } catch (const std::exception&) {
        }
    }
    return AttemptResult::Discarded;
}

Destination::Destination(std::string identifier, core::Severity minimum_level)
    : identifier_(std::move(identifier)), minimum_level_(minimum_level)
{
    if (identifier_.empty()) {
        throw core::ConfigurationError("Destination identifier cannot be empty");
    }
}

AttemptResult Destination::write(const core::LogEntry& entry)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    return attempt(identifier_, [this, &entry] { do_write(entry); });
}

} // namespace fanlog::sinks
