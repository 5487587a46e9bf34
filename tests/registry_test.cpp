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
 * @file registry_test.cpp
 * @brief Unit tests for the dispatcher: filtering, fan-out, isolation, history.
 *
 * @details
 * Uses in-memory destinations that record or reject what they receive, so the
 * registry's guarantees can be observed without touching any external channel:
 * 1. Level and enabled-flag filtering.
 * 2. The global switch short-circuits formatting.
 * 3. A failing destination never affects its siblings or the caller.
 * 4. Sequential dispatch preserves insertion order.
 * 5. Concurrent dispatch delivers every entry exactly once per destination.
 * 6. A hung destination cannot hold back the others once a timeout is set.
 */

#include "fanlog/core/error.hpp"
#include "fanlog/core/registry.hpp"
#include "framework.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using fanlog::core::ConfigurationError;
using fanlog::core::Registry;
using fanlog::core::Severity;

namespace {

/**
 * @class RecordingDestination
 * @brief Keeps every body it receives; optionally appends its id to a shared log.
 */
class RecordingDestination : public fanlog::sinks::Destination {
  public:
    explicit RecordingDestination(std::string id, Severity level = Severity::Debug,
                                  std::vector<std::string>* order = nullptr,
                                  std::mutex* order_mutex = nullptr)
        : Destination(std::move(id), level), order_(order), order_mutex_(order_mutex)
    {
    }

    std::vector<std::string> bodies() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return bodies_;
    }

    std::size_t count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return bodies_.size();
    }

  private:
    void do_write(const fanlog::core::LogEntry& entry) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            bodies_.push_back(entry.formatted_body);
        }
        if (order_) {
            std::lock_guard<std::mutex> lock(*order_mutex_);
            order_->push_back(identifier());
        }
    }

    mutable std::mutex mutex_;
    std::vector<std::string> bodies_;
    std::vector<std::string>* order_;
    std::mutex* order_mutex_;
};

/// @brief Fails every write.
class ThrowingDestination : public fanlog::sinks::Destination {
  public:
    explicit ThrowingDestination(std::string id) : Destination(std::move(id), Severity::Debug) {}

  private:
    void do_write(const fanlog::core::LogEntry&) override
    {
        throw std::runtime_error("destination offline");
    }
};

/// @brief Blocks every write for a fixed delay.
class SlowDestination : public fanlog::sinks::Destination {
  public:
    SlowDestination(std::string id, std::chrono::milliseconds delay)
        : Destination(std::move(id), Severity::Debug), delay_(delay)
    {
    }

    std::atomic<int> completed{0};

  private:
    void do_write(const fanlog::core::LogEntry&) override
    {
        std::this_thread::sleep_for(delay_);
        completed.fetch_add(1);
    }

    std::chrono::milliseconds delay_;
};

/// @brief Blocks its first write until released (or two seconds pass).
class BlockingDestination : public fanlog::sinks::Destination {
  public:
    explicit BlockingDestination(std::string id) : Destination(std::move(id), Severity::Debug) {}

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        condition_.notify_all();
    }

    std::atomic<int> entered{0};

  private:
    void do_write(const fanlog::core::LogEntry&) override
    {
        entered.fetch_add(1);
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait_for(lock, std::chrono::seconds(2), [this] { return released_; });
    }

    std::mutex mutex_;
    std::condition_variable condition_;
    bool released_ = false;
};

/// @brief Formatter that counts how often it is invoked.
class CountingFormatter : public fanlog::core::BodyFormatter {
  public:
    std::string format_body(const fanlog::core::Payload& payload) const override
    {
        calls.fetch_add(1);
        return inner_.format_body(payload);
    }

    mutable std::atomic<int> calls{0};

  private:
    fanlog::core::MessageFormatter inner_;
};

} // namespace

// ============================================================================
// Filtering
// ============================================================================

/**
 * @brief An entry reaches a destination iff it is enabled and the level passes.
 */
void test_registry_level_filter()
{
    auto warn_only = std::make_shared<RecordingDestination>("Warn", Severity::Warn);
    auto all = std::make_shared<RecordingDestination>("All", Severity::Debug);

    Registry registry;
    registry.add_or_replace(warn_only).add_or_replace(all);

    registry.debug("d");
    registry.info("i");
    registry.warn("w");
    registry.critical("c");

    std::vector<std::string> expected = {"w", "c"};
    ASSERT_TRUE(warn_only->bodies() == expected);
    ASSERT_EQ(all->count(), static_cast<size_t>(4));

    registry.set_minimum_level("Warn", Severity::Critical);
    registry.error("e");
    ASSERT_EQ(warn_only->count(), static_cast<size_t>(2));
}

void test_registry_destination_toggle()
{
    auto file = std::make_shared<RecordingDestination>("File");

    Registry registry;
    registry.add_or_replace(file);

    registry.disable("File");
    registry.info("skipped");
    registry.enable("File");
    registry.info("kept");

    std::vector<std::string> expected = {"kept"};
    ASSERT_TRUE(file->bodies() == expected);

    // Unknown identifiers are ignored; empty ones are rejected.
    registry.disable("Nope");
    registry.set_minimum_level("Nope", Severity::Error);
    ASSERT_THROWS(registry.disable(""), ConfigurationError);
    ASSERT_THROWS(registry.enable(""), ConfigurationError);
    ASSERT_THROWS(registry.set_minimum_level("", Severity::Info), ConfigurationError);
}

/**
 * @brief While globally disabled nothing is formatted or delivered.
 */
void test_registry_global_disable()
{
    auto sink = std::make_shared<RecordingDestination>("Sink");
    auto formatter = std::make_shared<CountingFormatter>();

    Registry registry;
    registry.add_or_replace(sink).set_body_formatter(formatter);

    registry.disable();
    ASSERT_FALSE(registry.is_enabled());
    registry.critical("muted");
    ASSERT_EQ(formatter->calls.load(), 0);
    ASSERT_EQ(sink->count(), static_cast<size_t>(0));

    registry.enable();
    registry.critical("loud");
    ASSERT_EQ(formatter->calls.load(), 1);
    ASSERT_EQ(sink->count(), static_cast<size_t>(1));
}

/**
 * @brief One formatting pass per call, whatever the number of destinations.
 */
void test_registry_formats_once()
{
    auto formatter = std::make_shared<CountingFormatter>();

    Registry registry;
    registry.set_body_formatter(formatter);
    for (int i = 0; i < 5; ++i) {
        registry.add_or_replace(std::make_shared<RecordingDestination>("D" + std::to_string(i)));
    }

    registry.info("once");
    ASSERT_EQ(formatter->calls.load(), 1);
}

// ============================================================================
// Registry management
// ============================================================================

/**
 * @brief Re-adding an identifier replaces the destination in place.
 */
void test_registry_add_or_replace()
{
    auto first = std::make_shared<RecordingDestination>("A");
    auto second = std::make_shared<RecordingDestination>("A");

    Registry registry;
    registry.add_or_replace(first)
        .add_or_replace(std::make_shared<RecordingDestination>("B"))
        .add_or_replace(second);

    ASSERT_EQ(registry.size(), static_cast<size_t>(2));
    std::vector<std::string> expected = {"A", "B"};
    ASSERT_TRUE(registry.identifiers() == expected);
    ASSERT_TRUE(registry.find("A") == second);

    registry.info("to the replacement");
    ASSERT_EQ(first->count(), static_cast<size_t>(0));
    ASSERT_EQ(second->count(), static_cast<size_t>(1));

    ASSERT_THROWS(registry.add_or_replace(nullptr), ConfigurationError);
}

void test_registry_remove()
{
    Registry registry;
    registry.add_or_replace(std::make_shared<RecordingDestination>("A"))
        .add_or_replace(std::make_shared<RecordingDestination>("B"));

    ASSERT_TRUE(registry.remove("A"));
    ASSERT_FALSE(registry.remove("A"));
    ASSERT_FALSE(registry.contains("A"));
    ASSERT_TRUE(registry.contains("B"));
    ASSERT_THROWS(registry.remove(""), ConfigurationError);

    registry.remove_all();
    ASSERT_EQ(registry.size(), static_cast<size_t>(0));
    ASSERT_TRUE(registry.find("B") == nullptr);
}

void test_registry_settings_validation()
{
    Registry registry;
    ASSERT_EQ(registry.time_format(), std::string("yyyy-MM-dd HH:mm:ss.fff"));
    ASSERT_THROWS(registry.set_time_format(std::string("")), ConfigurationError);
    ASSERT_THROWS(registry.set_body_formatter(nullptr), ConfigurationError);

    fanlog::core::TimeFormatBuilder builder;
    builder.hour(":").minute();
    registry.set_time_format(builder);
    ASSERT_EQ(registry.time_format(), std::string("HH:mm"));
}

// ============================================================================
// Dispatch
// ============================================================================

/**
 * @brief A throwing destination is discarded; its sibling still receives the entry.
 */
void test_registry_failure_isolation()
{
    auto good = std::make_shared<RecordingDestination>("DestB");

    Registry registry;
    registry.add_or_replace(std::make_shared<ThrowingDestination>("DestA")).add_or_replace(good);

    registry.error("survives");

    ASSERT_EQ(good->count(), static_cast<size_t>(1));
    ASSERT_EQ(registry.discarded_writes(), static_cast<std::uint64_t>(1));

    registry.set_concurrent_dispatch(false);
    registry.error("survives again");
    ASSERT_EQ(good->count(), static_cast<size_t>(2));
    ASSERT_EQ(registry.discarded_writes(), static_cast<std::uint64_t>(2));
}

/**
 * @brief Sequential dispatch writes in insertion order on the calling thread.
 */
void test_registry_sequential_order()
{
    std::vector<std::string> order;
    std::mutex order_mutex;

    Registry registry;
    registry.set_concurrent_dispatch(false);
    ASSERT_FALSE(registry.concurrent_dispatch());
    registry
        .add_or_replace(
            std::make_shared<RecordingDestination>("C", Severity::Debug, &order, &order_mutex))
        .add_or_replace(
            std::make_shared<RecordingDestination>("A", Severity::Debug, &order, &order_mutex))
        .add_or_replace(
            std::make_shared<RecordingDestination>("B", Severity::Debug, &order, &order_mutex));

    registry.info("one");
    registry.info("two");

    std::vector<std::string> expected = {"C", "A", "B", "C", "A", "B"};
    ASSERT_TRUE(order == expected);
}

/**
 * @brief Concurrent calls from several threads reach each destination exactly once.
 */
void test_registry_concurrent_delivery()
{
    std::vector<std::shared_ptr<RecordingDestination>> sinks;

    Registry registry;
    ASSERT_TRUE(registry.concurrent_dispatch());
    for (int i = 0; i < 4; ++i) {
        auto sink = std::make_shared<RecordingDestination>("S" + std::to_string(i));
        sinks.push_back(sink);
        registry.add_or_replace(sink);
    }

    std::vector<std::thread> callers;
    for (int t = 0; t < 4; ++t) {
        callers.emplace_back([&registry] {
            for (int i = 0; i < 50; ++i) {
                registry.info(i);
            }
        });
    }
    for (auto& c : callers) {
        c.join();
    }

    for (const auto& sink : sinks) {
        ASSERT_EQ(sink->count(), static_cast<size_t>(200));
    }
    ASSERT_EQ(registry.discarded_writes(), static_cast<std::uint64_t>(0));
}

/**
 * @brief A hung destination delays the caller by the timeout, not by its own latency.
 */
void test_registry_dispatch_timeout()
{
    auto slow = std::make_shared<SlowDestination>("Slow", std::chrono::milliseconds(400));
    auto fast = std::make_shared<RecordingDestination>("Fast");

    Registry registry;
    registry.set_dispatch_timeout(std::chrono::milliseconds(20));
    registry.add_or_replace(slow).add_or_replace(fast);

    const auto start = std::chrono::steady_clock::now();
    registry.info("hurry");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(elapsed < std::chrono::milliseconds(300));

    // The abandoned write still completes in the background.
    for (int i = 0; i < 100 && slow->completed.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_EQ(slow->completed.load(), 1);
    ASSERT_EQ(fast->count(), static_cast<size_t>(1));
}

/**
 * @brief A destination stuck in a write is skipped instead of pinning the pool.
 *
 * The first call abandons the hung write after the timeout. Later calls count
 * the hung destination as discarded and still reach the healthy one.
 */
void test_registry_hung_destination_isolated()
{
    auto hung = std::make_shared<BlockingDestination>("Hung");
    auto healthy = std::make_shared<RecordingDestination>("Healthy");

    Registry registry;
    registry.set_dispatch_timeout(std::chrono::milliseconds(50));
    registry.add_or_replace(hung).add_or_replace(healthy);

    for (int i = 0; i < 6; ++i) {
        registry.info("call " + std::to_string(i));
    }

    for (int i = 0; i < 100 && healthy->count() < 6; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    ASSERT_EQ(healthy->count(), static_cast<size_t>(6));
    ASSERT_EQ(hung->entered.load(), 1);
    ASSERT_EQ(registry.discarded_writes(), static_cast<std::uint64_t>(5));

    hung->release();
}

// ============================================================================
// History
// ============================================================================

/**
 * @brief Enable, pause, resume, clear and disable the recorded history.
 */
void test_registry_history_lifecycle()
{
    Registry registry;
    registry.set_time_format("'T'");

    registry.info("before");
    ASSERT_TRUE(registry.history_snapshot().empty());

    registry.enable_history(2);
    ASSERT_TRUE(registry.history_enabled());
    registry.info("one");
    registry.warn("two");
    registry.error("three");

    std::vector<std::string> expected = {"T [WRN] two", "T [ERR] three"};
    ASSERT_TRUE(registry.history_snapshot() == expected);

    registry.pause_history();
    ASSERT_FALSE(registry.history_enabled());
    registry.info("paused");
    ASSERT_TRUE(registry.history_snapshot() == expected);

    // Resuming keeps the buffer and its original capacity.
    registry.enable_history(100);
    registry.critical("four");
    expected = {"T [ERR] three", "T [CRT] four"};
    ASSERT_TRUE(registry.history_snapshot() == expected);

    registry.clear_history();
    ASSERT_TRUE(registry.history_snapshot().empty());

    registry.info("five");
    registry.disable_history();
    ASSERT_TRUE(registry.history_snapshot().empty());
    registry.info("six");
    ASSERT_TRUE(registry.history_snapshot().empty());

    ASSERT_THROWS(registry.enable_history(0), ConfigurationError);
}

/**
 * @brief History records entries even when no destination accepts them.
 */
void test_registry_history_without_destinations()
{
    Registry registry;
    registry.enable_history(10);
    registry.debug("unrouted");

    ASSERT_EQ(registry.history_snapshot().size(), static_cast<size_t>(1));
}
