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
 * @file logger.hpp
 * @brief Self-diagnostics channel of the fanlog library.
 *
 * @details
 * fanlog cannot log its own failures through a `Registry` without risking
 * recursion, so internal events (discarded destination writes, configuration
 * loading, the demo program's status lines) go through this static console
 * writer instead. It is **disabled by default**: a destination failure is never
 * reported unless the host application opts in with `Logger::set_enabled(true)`.
 */

#pragma once

#include "fanlog/core/severity.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace fanlog::infra {

/**
 * @class Logger
 * @brief Static, thread-safe, ANSI-colored console writer.
 *
 * @details
 * Every message is written while holding `console_mutex()`, the same lock the
 * console destination uses, so diagnostics and application output never
 * interleave within a line.
 */
class Logger {
  public:
    /**
     * @brief Writes a diagnostic message to the console if diagnostics are enabled.
     *
     * **Stream Routing Logic:**
     * - `Debug`, `Info`: Routed to `std::cout`.
     * - `Warn`, `Error`, `Critical`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * fanlog::infra::Logger::set_enabled(true);
     * fanlog::infra::Logger::log(fanlog::core::Severity::Warn, "File: archive rename failed");
     * @endcode
     */
    static void log(core::Severity level, const std::string& message);

    /// @brief Turns self-diagnostics on or off process-wide.
    static void set_enabled(bool enabled) noexcept;

    static bool enabled() noexcept;

    /**
     * @brief Lock guarding `std::cout` / `std::cerr` for line-atomic output.
     */
    static std::mutex& console_mutex() noexcept;

  private:
    static std::atomic<bool> enabled_;
};

} // namespace fanlog::infra
