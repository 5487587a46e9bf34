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
 * @file logger.cpp
 * @brief Implementation of the self-diagnostics console writer.
 *
 * @details
 * Output format: `[YYYY-MM-DD HH:MM:SS] fanlog [CODE] message`, color-coded per
 * severity with ANSI escape sequences.
 */

#include "fanlog/infra/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace fanlog::infra {

std::atomic<bool> Logger::enabled_{false};

std::mutex& Logger::console_mutex() noexcept
{
    static std::mutex mutex;
    return mutex;
}

void Logger::set_enabled(bool enabled) noexcept
{
    enabled_.store(enabled, std::memory_order_relaxed);
}

bool Logger::enabled() noexcept
{
    return enabled_.load(std::memory_order_relaxed);
}

/**
 * @brief Dispatches a formatted diagnostic line to the appropriate system stream.
 *
 * 1. **Gate**: Returns immediately while diagnostics are disabled.
 * 2. **Synchronization**: Acquires the console lock to prevent interleaved output.
 * 3. **Chronometry**: Captures and formats the local wall clock.
 * 4. **Stylization**: Injects ANSI escape sequences for visual categorization.
 */
void Logger::log(core::Severity level, const std::string& message)
{
    if (!enabled()) {
        return;
    }

    std::lock_guard<std::mutex> lock(console_mutex());

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);

    // WARN and above bypass stdout buffering.
    auto& stream = core::at_least(level, core::Severity::Warn) ? std::cerr : std::cout;

    stream << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "] fanlog ";

    switch (level) {
    case core::Severity::Debug:
        stream << "\033[36m";
        break;
    case core::Severity::Info:
        stream << "\033[32m";
        break;
    case core::Severity::Warn:
        stream << "\033[33m";
        break;
    case core::Severity::Error:
        stream << "\033[31m";
        break;
    case core::Severity::Critical:
        stream << "\033[1;31m";
        break;
    }

    stream << "[" << core::short_code(level) << "] " << message << "\033[0m" << std::endl;
}

} // namespace fanlog::infra
