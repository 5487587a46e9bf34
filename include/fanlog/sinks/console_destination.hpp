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
 * @file console_destination.hpp
 * @brief Interactive terminal and trace stream destinations.
 */

#pragma once

#include "fanlog/sinks/destination.hpp"

#include <iostream>
#include <ostream>
#include <string>

namespace fanlog::sinks {

/**
 * @class ConsoleDestination
 * @brief Writes full lines to standard output.
 *
 * Only meaningful for an interactive process: construction fails when standard
 * output is not attached to a terminal (daemon, redirected output, CI runner).
 */
class ConsoleDestination : public Destination {
  public:
    /**
     * @throws core::ConfigurationError if the identifier is empty or stdout is
     * not a terminal.
     */
    explicit ConsoleDestination(std::string identifier,
                                core::Severity minimum_level = core::Severity::Debug);

    /// @brief True when standard output is attached to a terminal.
    static bool interactive() noexcept;

  private:
    void do_write(const core::LogEntry& entry) override;
};

/**
 * @class TraceDestination
 * @brief Writes full lines to a diagnostic trace stream.
 *
 * The stream defaults to `std::clog`; any `std::ostream` that outlives the
 * destination may be supplied instead. Writes to `std::clog`, `std::cerr` or
 * `std::cout` hold `infra::Logger::console_mutex()`, so trace lines never
 * split a self-diagnostics line.
 */
class TraceDestination : public Destination {
  public:
    explicit TraceDestination(std::string identifier,
                              core::Severity minimum_level = core::Severity::Debug,
                              std::ostream& stream = std::clog);

  private:
    void do_write(const core::LogEntry& entry) override;

    std::ostream& stream_;
};

} // namespace fanlog::sinks
