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
 * @file registry.hpp
 * @brief The dispatcher: destination registry, filtering and fan-out.
 *
 * @details
 * A `Registry` is what application code calls "the logger". It owns a set of
 * destinations keyed by identifier, formats each log call exactly once, selects
 * the destinations whose filter accepts the entry, writes the entry to all of
 * them (concurrently by default), and optionally keeps the formatted line in a
 * bounded history.
 *
 * A registry is ordinary caller-owned state: create as many as needed; nothing
 * is shared between instances.
 */

#pragma once

#include "fanlog/core/formatter.hpp"
#include "fanlog/core/history.hpp"
#include "fanlog/core/payload.hpp"
#include "fanlog/core/severity.hpp"
#include "fanlog/core/time_format.hpp"
#include "fanlog/infra/scheduler.hpp"
#include "fanlog/sinks/destination.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace fanlog::core {

/**
 * @class Registry
 * @brief Owns destinations and dispatches leveled log calls to them.
 *
 * @details
 * **Concurrency Control:** configuration lives behind a `std::shared_mutex`.
 * A log call holds the shared lock only long enough to snapshot the qualifying
 * destinations and settings; mutators take the exclusive lock. Log calls from
 * many threads therefore proceed in parallel, and a destination removed while a
 * call is in flight still receives that call's entry.
 *
 * **Error Model:** invalid configuration input throws `ConfigurationError`.
 * Log calls never throw because of a destination: write failures are discarded
 * at the destination boundary and only counted (`discarded_writes()`).
 *
 * @code
 * fanlog::core::Registry logger;
 * logger.add_or_replace(std::make_shared<fanlog::sinks::FileDestination>("File", "./logs"))
 *       .enable_history(100);
 * logger.info("Service started");
 * logger.error(std::runtime_error("disk quota exceeded"));
 * @endcode
 */
class Registry {
  public:
    Registry();
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // ========================================================================
    //  DESTINATIONS
    // ========================================================================

    /**
     * @brief Adds @p destination, or replaces the one with the same identifier.
     *
     * A replacement takes over the previous destination's position in the
     * insertion order; none of the previous configuration is kept.
     *
     * @throws ConfigurationError if @p destination is null.
     */
    Registry& add_or_replace(std::shared_ptr<sinks::Destination> destination);

    /**
     * @brief Removes the destination registered under @p identifier.
     * @return true if a destination was found and removed.
     * @throws ConfigurationError if @p identifier is empty.
     */
    bool remove(const std::string& identifier);

    void remove_all();

    /// @brief The destination registered under @p identifier, or nullptr.
    std::shared_ptr<sinks::Destination> find(const std::string& identifier) const;

    bool contains(const std::string& identifier) const;

    std::size_t size() const;

    /// @brief Registered identifiers in insertion order.
    std::vector<std::string> identifiers() const;

    /**
     * @brief Enables one destination. No-op if @p identifier is not registered.
     * @throws ConfigurationError if @p identifier is empty.
     */
    void enable(const std::string& identifier);

    /**
     * @brief Disables one destination. No-op if @p identifier is not registered.
     * @throws ConfigurationError if @p identifier is empty.
     */
    void disable(const std::string& identifier);

    /**
     * @brief Changes one destination's filter. No-op if not registered.
     * @throws ConfigurationError if @p identifier is empty.
     */
    void set_minimum_level(const std::string& identifier, Severity level);

    // ========================================================================
    //  SETTINGS
    // ========================================================================

    /// @brief Master switch. While disabled, log calls return immediately.
    Registry& set_global_enabled(bool enabled) noexcept;
    void enable() noexcept { set_global_enabled(true); }
    void disable() noexcept { set_global_enabled(false); }
    bool is_enabled() const noexcept { return enabled_.load(); }

    /**
     * @brief Sets the timestamp pattern (default `"yyyy-MM-dd HH:mm:ss.fff"`).
     * @throws ConfigurationError if @p pattern is empty.
     */
    Registry& set_time_format(const std::string& pattern);

    /// @overload
    Registry& set_time_format(const TimeFormatBuilder& builder);

    std::string time_format() const;

    /// @brief Concurrent (default) or sequential, insertion-ordered fan-out.
    Registry& set_concurrent_dispatch(bool concurrent) noexcept;
    bool concurrent_dispatch() const noexcept { return concurrent_.load(); }

    /**
     * @brief Upper bound on how long a concurrent log call waits for its writes.
     *
     * `0` (default) waits for every write. When the bound elapses the call
     * returns; the remaining writes still complete on the worker pool.
     */
    Registry& set_dispatch_timeout(std::chrono::milliseconds timeout) noexcept;

    /**
     * @brief Replaces the payload formatter (default `MessageFormatter`).
     * @throws ConfigurationError if @p formatter is null.
     */
    Registry& set_body_formatter(std::shared_ptr<const BodyFormatter> formatter);

    // ========================================================================
    //  HISTORY
    // ========================================================================

    /**
     * @brief Starts recording full lines.
     *
     * Creates a buffer of @p capacity lines if none exists; resuming after
     * `pause_history()` keeps the existing buffer and its capacity.
     *
     * @throws ConfigurationError if a new buffer is needed and @p capacity is 0.
     */
    Registry& enable_history(std::size_t capacity = 1000);

    /// @brief Stops recording and discards the buffer.
    void disable_history();

    /// @brief Stops recording; the buffer and its contents are kept.
    void pause_history();

    void clear_history();

    /// @brief Recorded lines, oldest first. Empty when there is no buffer.
    std::vector<std::string> history_snapshot() const;

    bool history_enabled() const;

    // ========================================================================
    //  LOGGING
    // ========================================================================

    void debug(Payload payload) { log(Severity::Debug, std::move(payload)); }
    void info(Payload payload) { log(Severity::Info, std::move(payload)); }
    void warn(Payload payload) { log(Severity::Warn, std::move(payload)); }
    void error(Payload payload) { log(Severity::Error, std::move(payload)); }
    void critical(Payload payload) { log(Severity::Critical, std::move(payload)); }

    /**
     * @brief Dispatches one entry.
     *
     * 1. Returns at once while globally disabled.
     * 2. Builds the entry and formats it once.
     * 3. Writes it to every enabled destination whose minimum level it meets.
     * 4. Appends the full line to the history if recording.
     */
    void log(Severity level, Payload payload);

    /// @brief Number of destination writes discarded since construction.
    std::uint64_t discarded_writes() const noexcept { return discarded_.load(); }

  private:
    using DestinationPtr = std::shared_ptr<sinks::Destination>;

    std::vector<DestinationPtr>::iterator locate(const std::string& identifier);
    std::vector<DestinationPtr>::const_iterator locate(const std::string& identifier) const;

    void fan_out(const std::vector<DestinationPtr>& targets,
                 const std::shared_ptr<const LogEntry>& entry, bool concurrent,
                 std::chrono::milliseconds timeout);

    void record(sinks::AttemptResult result) noexcept;

    infra::Scheduler& scheduler();

    /// @brief Guards every configuration member below.
    mutable std::shared_mutex mutex_;

    std::vector<DestinationPtr> destinations_;
    std::string time_format_;
    std::shared_ptr<const BodyFormatter> formatter_;
    std::shared_ptr<HistoryBuffer> history_;
    bool history_recording_ = false;
    std::chrono::milliseconds timeout_{0};

    std::atomic<bool> enabled_{true};
    std::atomic<bool> concurrent_{true};
    std::atomic<std::uint64_t> discarded_{0};

    std::mutex scheduler_mutex_;

    /// @brief Declared last: destroyed first, draining writes that outlived a timeout.
    std::unique_ptr<infra::Scheduler> scheduler_;
};

} // namespace fanlog::core
