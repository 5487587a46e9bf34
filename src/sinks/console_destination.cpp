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
 * @file console_destination.cpp
 * @brief Console and trace stream destinations.
 */

#include "fanlog/sinks/console_destination.hpp"

#include "fanlog/core/error.hpp"
#include "fanlog/infra/logger.hpp"

#include <iostream>
#include <mutex>
#include <unistd.h>

namespace fanlog::sinks {

ConsoleDestination::ConsoleDestination(std::string identifier, core::Severity minimum_level)
    : Destination(std::move(identifier), minimum_level)
{
    if (!interactive()) {
        throw core::ConfigurationError(
            "The process must be attached to a terminal to use a console destination");
    }
}

bool ConsoleDestination::interactive() noexcept
{
    return isatty(STDOUT_FILENO) == 1;
}

void ConsoleDestination::do_write(const core::LogEntry& entry)
{
    // Shared with the self-diagnostics writer so lines never interleave.
    std::lock_guard<std::mutex> lock(infra::Logger::console_mutex());
    std::cout << entry.full_line << std::endl;
}

TraceDestination::TraceDestination(std::string identifier, core::Severity minimum_level,
                                   std::ostream& stream)
    : Destination(std::move(identifier), minimum_level), stream_(stream)
{
}

void TraceDestination::do_write(const core::LogEntry& entry)
{
    // The process streams are shared with the self-diagnostics writer.
    std::unique_lock<std::mutex> console;
    if (&stream_ == &std::clog || &stream_ == &std::cerr || &stream_ == &std::cout) {
        console = std::unique_lock<std::mutex>(infra::Logger::console_mutex());
    }

    stream_ << entry.full_line << '\n';
    stream_.flush();
    if (!stream_.good()) {
        stream_.clear();
        throw core::WriteFailure("Trace stream rejected the entry");
    }
}

} // namespace fanlog::sinks
