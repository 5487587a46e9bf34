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
 * @file destination.hpp
 * @brief Capability interface shared by every output destination.
 *
 * @details
 * A destination is {identifier, minimum level, enabled flag, write}. Concrete
 * sinks implement only `do_write()`. The non-virtual `write()` wraps it with the
 * two guarantees every destination gives the registry:
 *
 * 1. **Serialization**: calls on one destination instance never overlap, so
 *    multi-step writes (file maintenance + append) are atomic per instance.
 * 2. **Failure isolation**: anything thrown by `do_write()` is discarded by the
 *    `attempt()` policy and never reaches the logging caller.
 * 3. **Stall tracking**: a write still running after its dispatch timed out is
 *    counted as abandoned; the registry skips the destination until it returns.
 *
 * `write()` is private; only `core::Registry` dispatches entries.
 */

#pragma once

#include "fanlog/core/log_entry.hpp"
#include "fanlog/core/severity.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace fanlog::core {
class Registry;
} // namespace fanlog::core

namespace fanlog::sinks {

/**
 * @enum AttemptResult
 * @brief Outcome of a guarded operation.
 */
enum class AttemptResult {
    Ok,       ///< The operation returned normally.
    Discarded ///< The operation threw; the exception was dropped.
};

/**
 * @brief Runs @p operation and converts any exception into `Discarded`.
 *
 * This is the "attempt, discard" policy applied at every destination boundary.
 * A discarded failure is reported through `infra::Logger` (which is silent unless
 * self-diagnostics are enabled), tagged with @p context.
 *
 * @param context Short label used in the diagnostic line, e.g. the identifier.
 * @param operation The work to run.
 */
AttemptResult attempt(const std::string& context, const std::function<void()>& operation) noexcept;

/**
 * @class Destination
 * @brief Abstract output channel with its own filter.
 */
class Destination {
  public:
    virtual ~Destination() = default;

    Destination(const Destination&) = delete;
    Destination& operator=(const Destination&) = delete;

    const std::string& identifier() const noexcept { return identifier_; }

    core::Severity minimum_level() const noexcept { return minimum_level_.load(); }
    void set_minimum_level(core::Severity level) noexcept { minimum_level_.store(level); }

    bool enabled() const noexcept { return enabled_.load(); }
    void set_enabled(bool enabled) noexcept { enabled_.store(enabled); }

    /// @brief True if an entry of @p level passes this destination's filter.
    bool accepts(core::Severity level) const noexcept
    {
        return enabled() && core::at_least(level, minimum_level());
    }

    /// @brief Identifier plus the address of the underlying channel.
    virtual std::string describe() const { return identifier_; }

  protected:
    /**
     * @param identifier Registry key. Must not be empty.
     * @param minimum_level Lowest severity written by this destination.
     * @throws core::ConfigurationError if @p identifier is empty.
     */
    Destination(std::string identifier, core::Severity minimum_level);

  private:
    friend class core::Registry;

    /// @brief Serialized, failure-isolated delivery of @p entry.
    AttemptResult write(const core::LogEntry& entry);

    /**
     * @brief Delivers @p entry to the underlying channel.
     *
     * May throw on failure; the exception is discarded by `write()`.
     */
    virtual void do_write(const core::LogEntry& entry) = 0;

    const std::string identifier_;
    std::atomic<core::Severity> minimum_level_;
    std::atomic<bool> enabled_{true};
    std::mutex write_mutex_;

    /// @brief Writes that outlived their dispatch timeout and have not returned yet.
    std::atomic<int> abandoned_writes_{0};
};

} // namespace fanlog::sinks
