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
 * @file scheduler.hpp
 * @brief Thread pool used for concurrent destination fan-out.
 *
 * @details
 * This header defines the `Scheduler` class, a Producer-Consumer worker pool.
 * A `Registry` owns one and uses `run_all()` to write one entry to several
 * destinations at once, blocking the logging thread until every write has
 * finished (spawn-N / join-all).
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace fanlog::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * @details
 * The Scheduler maintains a fixed cohort of worker threads and a FIFO task queue.
 * Reusing threads keeps the per-log-call overhead of a concurrent fan-out down to
 * a queue push and a condition variable wake-up.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task or `run_all()` a batch.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 */
class Scheduler {
  public:
    /**
     * @brief Initializes the thread pool and spawns worker threads.
     *
     * @param threads The number of worker threads to spawn. Zero is raised to one.
     */
    explicit Scheduler(std::size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Drains the queue and joins every worker.
     *
     * @note This is a **blocking** operation: tasks still queued (including writes
     * abandoned by a timed-out `run_all`) complete before the pool is destroyed.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * @param task The unit of work. Must not throw.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Runs every task on the pool and waits for all of them.
     *
     * @param tasks Units of work; each must not throw.
     * @param timeout Maximum time to wait. `0` waits until every task completed.
     * @return true if every task completed before returning; false if the timeout
     * elapsed first. Unfinished tasks keep running in the background and must own
     * whatever state they touch.
     */
    bool run_all(std::vector<std::function<void()>> tasks,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    /// @brief Number of worker threads in the cohort.
    std::size_t size() const noexcept { return workers_.size(); }

  private:
    /// @brief The container of active worker threads managed by this pool.
    std::vector<std::thread> workers_;

    /// @brief A FIFO queue storing pending tasks waiting for a worker.
    std::queue<std::function<void()>> tasks_;

    /// @brief Synchronization primitive protecting access to the `tasks_` queue.
    std::mutex queue_mutex_;

    /// @brief Signaling mechanism used to wake up workers or notify shutdown.
    std::condition_variable condition_;

    /// @brief Atomic flag controlling the lifecycle of the event loops.
    std::atomic<bool> stop_;
};

} // namespace fanlog::infra
