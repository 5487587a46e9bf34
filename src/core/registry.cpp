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
 * @file registry.cpp
 * @brief Destination bookkeeping and the dispatch pipeline.
 *
 * @details
 * Lock discipline: `mutex_` (shared for readers, exclusive for writers) protects
 * configuration only. No destination is ever written while `mutex_` is held, so
 * a slow destination cannot stall configuration changes or other log calls'
 * snapshot phase.
 */

#include "fanlog/core/registry.hpp"

#include "fanlog/core/error.hpp"
#include "fanlog/core/log_entry.hpp"
#include "fanlog/infra/logger.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <thread>

namespace fanlog::core {

namespace {

// Lifecycle of one concurrent write task, shared between the task and fan_out().
constexpr int kTaskPending = 0;
constexpr int kTaskFinished = 1;
constexpr int kTaskAbandoned = 2;

void require_identifier(const std::string& identifier)
{
    if (identifier.empty()) {
        throw ConfigurationError("Destination identifier cannot be empty");
    }
}

} // namespace

Registry::Registry()
    : time_format_(kDefaultTimeFormat), formatter_(std::make_shared<MessageFormatter>())
{
}

Registry::~Registry() = default;

// ============================================================================
//  DESTINATIONS
// ============================================================================

std::vector<Registry::DestinationPtr>::iterator Registry::locate(const std::string& identifier)
{
    return std::find_if(destinations_.begin(), destinations_.end(),
                        [&identifier](const DestinationPtr& d) {
                            return d->identifier() == identifier;
                        });
}

std::vector<Registry::DestinationPtr>::const_iterator
Registry::locate(const std::string& identifier) const
{
    return std::find_if(destinations_.begin(), destinations_.end(),
                        [&identifier](const DestinationPtr& d) {
                            return d->identifier() == identifier;
                        });
}

Registry& Registry::add_or_replace(std::shared_ptr<sinks::Destination> destination)
{
    if (!destination) {
        throw ConfigurationError("Destination cannot be null");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = locate(destination->identifier());
    if (it != destinations_.end()) {
        *it = std::move(destination);
    } else {
        destinations_.push_back(std::move(destination));
    }
    return *this;
}

bool Registry::remove(const std::string& identifier)
{
    require_identifier(identifier);

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = locate(identifier);
    if (it == destinations_.end()) {
        return false;
    }
    destinations_.erase(it);
    return true;
}

void Registry::remove_all()
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    destinations_.clear();
}

std::shared_ptr<sinks::Destination> Registry::find(const std::string& identifier) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = locate(identifier);
    return it == destinations_.end() ? nullptr : *it;
}

bool Registry::contains(const std::string& identifier) const
{
    return find(identifier) != nullptr;
}

std::size_t Registry::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return destinations_.size();
}

std::vector<std::string> Registry::identifiers() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> ids;
    ids.reserve(destinations_.size());
    for (const auto& d : destinations_) {
        ids.push_back(d->identifier());
    }
    return ids;
}

// Absent identifiers are a silent no-op: these run on hot paths that must not throw
// because of a typo in a destination name.
void Registry::enable(const std::string& identifier)
{
    require_identifier(identifier);
    if (auto d = find(identifier)) {
        d->set_enabled(true);
    }
}

void Registry::disable(const std::string& identifier)
{
    require_identifier(identifier);
    if (auto d = find(identifier)) {
        d->set_enabled(false);
    }
}

void Registry::set_minimum_level(const std::string& identifier, Severity level)
{
    require_identifier(identifier);
    if (auto d = find(identifier)) {
        d->set_minimum_level(level);
    }
}

// ============================================================================
//  SETTINGS
// ============================================================================

Registry& Registry::set_global_enabled(bool enabled) noexcept
{
    enabled_.store(enabled);
    return *this;
}

Registry& Registry::set_time_format(const std::string& pattern)
{
    if (pattern.empty()) {
        throw ConfigurationError("Time format cannot be empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    time_format_ = pattern;
    return *this;
}

Registry& Registry::set_time_format(const TimeFormatBuilder& builder)
{
    return set_time_format(builder.to_pattern());
}

std::string Registry::time_format() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return time_format_;
}

Registry& Registry::set_concurrent_dispatch(bool concurrent) noexcept
{
    concurrent_.store(concurrent);
    return *this;
}

Registry& Registry::set_dispatch_timeout(std::chrono::milliseconds timeout) noexcept
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    timeout_ = timeout.count() < 0 ? std::chrono::milliseconds::zero() : timeout;
    return *this;
}

Registry& Registry::set_body_formatter(std::shared_ptr<const BodyFormatter> formatter)
{
    if (!formatter) {
        throw ConfigurationError("Body formatter cannot be null");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    formatter_ = std::move(formatter);
    return *this;
}

// ============================================================================
//  HISTORY
// ============================================================================

Registry& Registry::enable_history(std::size_t capacity)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!history_) {
        history_ = std::make_shared<HistoryBuffer>(capacity);
    }
    history_recording_ = true;
    return *this;
}

void Registry::disable_history()
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    history_recording_ = false;
    history_.reset();
}

void Registry::pause_history()
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    history_recording_ = false;
}

void Registry::clear_history()
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (history_) {
        history_->clear();
    }
}

std::vector<std::string> Registry::history_snapshot() const
{
    std::shared_ptr<HistoryBuffer> history;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        history = history_;
    }
    return history ? history->snapshot() : std::vector<std::string>{};
}

bool Registry::history_enabled() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return history_recording_;
}

// ============================================================================
//  DISPATCH
// ============================================================================

/**
 * @brief The dispatch pipeline.
 *
 * 1. **Gate**: globally disabled calls return before anything is built.
 * 2. **Snapshot**: under the shared lock, copy the qualifying destinations and
 *    the settings this call needs.
 * 3. **Format**: body and full line, once, outside any lock.
 * 4. **Fan-out**: concurrent or sequential.
 * 5. **History**: appended whatever the destinations' outcome.
 */
void Registry::log(Severity level, Payload payload)
{
    if (!enabled_.load()) {
        return;
    }

    std::vector<DestinationPtr> targets;
    std::string pattern;
    std::shared_ptr<const BodyFormatter> formatter;
    std::shared_ptr<HistoryBuffer> history;
    std::chrono::milliseconds timeout{0};

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        for (const auto& d : destinations_) {
            if (d->accepts(level)) {
                targets.push_back(d);
            }
        }
        pattern = time_format_;
        formatter = formatter_;
        timeout = timeout_;
        if (history_recording_) {
            history = history_;
        }
    }

    auto entry = std::make_shared<LogEntry>(level, std::move(payload));
    entry->formatted_body = formatter->format_body(entry->payload);
    entry->full_line = format_line(*entry, pattern);

    fan_out(targets, entry, concurrent_.load(), timeout);

    if (history) {
        history->append(entry->full_line);
    }
}

/**
 * @brief Writes @p entry to every target.
 *
 * Sequential mode (and a lone target without a timeout) writes inline on the
 * calling thread, in insertion order. Concurrent mode submits one task per
 * target and joins them. Tasks hold their own references to the entry and the
 * destination, so a timed-out call may return while writes are still running.
 *
 * A destination whose earlier write was abandoned by a timeout is skipped and
 * the entry counts as discarded for it. Queuing more work behind a hung write
 * would pin one pool thread per call and starve the healthy destinations.
 */
void Registry::fan_out(const std::vector<DestinationPtr>& targets,
                       const std::shared_ptr<const LogEntry>& entry, bool concurrent,
                       std::chrono::milliseconds timeout)
{
    std::vector<DestinationPtr> live;
    live.reserve(targets.size());
    for (const auto& d : targets) {
        if (d->abandoned_writes_.load() > 0) {
            record(sinks::AttemptResult::Discarded);
            infra::Logger::log(Severity::Debug,
                               d->identifier() + ": write discarded, previous write still pending");
            continue;
        }
        live.push_back(d);
    }

    if (live.empty()) {
        return;
    }

    if (!concurrent || (live.size() == 1 && timeout.count() == 0)) {
        for (const auto& d : live) {
            record(d->write(*entry));
        }
        return;
    }

    std::vector<std::shared_ptr<std::atomic<int>>> states;
    std::vector<std::function<void()>> tasks;
    states.reserve(live.size());
    tasks.reserve(live.size());
    for (const auto& d : live) {
        auto state = std::make_shared<std::atomic<int>>(kTaskPending);
        states.push_back(state);
        tasks.emplace_back([this, d, entry, state] {
            record(d->write(*entry));
            if (state->exchange(kTaskFinished) == kTaskAbandoned) {
                d->abandoned_writes_.fetch_sub(1);
            }
        });
    }

    if (!scheduler().run_all(std::move(tasks), timeout)) {
        for (std::size_t i = 0; i < live.size(); ++i) {
            int expected = kTaskPending;
            if (states[i]->compare_exchange_strong(expected, kTaskAbandoned)) {
                live[i]->abandoned_writes_.fetch_add(1);
            }
        }
        infra::Logger::log(Severity::Warn, "Registry: dispatch timed out after " +
                                               std::to_string(timeout.count()) +
                                               " ms; pending writes continue in background");
    }
}

void Registry::record(sinks::AttemptResult result) noexcept
{
    if (result == sinks::AttemptResult::Discarded) {
        discarded_.fetch_add(1);
    }
}

infra::Scheduler& Registry::scheduler()
{
    std::lock_guard<std::mutex> lock(scheduler_mutex_);

    if (!scheduler_) {
        const std::size_t threads = std::max<std::size_t>(2, std::thread::hardware_concurrency());
        scheduler_ = std::make_unique<infra::Scheduler>(threads);
    }
    return *scheduler_;
}

} // namespace fanlog::core
