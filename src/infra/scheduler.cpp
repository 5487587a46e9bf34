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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool and its join-all barrier.
 *
 * @details
 * Workers follow the producer-consumer pattern with a condition variable. The
 * join-all barrier of `run_all` is a small latch shared (by `shared_ptr`) between
 * the caller and the submitted tasks, so a caller that stops waiting after a
 * timeout leaves no dangling reference behind.
 */

#include "fanlog/infra/scheduler.hpp"

#include <memory>

namespace fanlog::infra {

namespace {

/// Countdown shared by one `run_all` batch.
struct Latch {
    std::mutex mutex;
    std::condition_variable done;
    std::size_t remaining = 0;
};

} // namespace

/**
 * @brief Constructs the scheduler and initializes the worker cohort.
 *
 * Each thread enters a dormant event loop, waiting for tasks without consuming
 * CPU cycles until signaled.
 */
Scheduler::Scheduler(std::size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }

    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;

                // --- Critical Section: Task Acquisition ---
                {
                    std::unique_lock<std::mutex> lock(this->queue_mutex_);

                    this->condition_.wait(lock,
                                          [this] { return this->stop_ || !this->tasks_.empty(); });

                    // Exit only once stopping AND drained, so abandoned writes still land.
                    if (this->stop_ && this->tasks_.empty()) {
                        return;
                    }

                    task = std::move(this->tasks_.front());
                    this->tasks_.pop();
                }

                // Executed outside the lock so other workers can pick up tasks.
                if (task) {
                    task();
                }
            }
        });
    }
}

/**
 * @brief Destructor. Orchestrates a graceful pool teardown.
 */
Scheduler::~Scheduler()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

/**
 * @brief Dispatches a new task to the worker pool and wakes one worker.
 */
void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }

    condition_.notify_one();
}

/**
 * @brief Spawn-N / join-all over the pool.
 *
 * Every task is wrapped so that it counts the shared latch down after running.
 * The caller then blocks on the latch, optionally bounded by @p timeout.
 */
bool Scheduler::run_all(std::vector<std::function<void()>> tasks,
                        std::chrono::milliseconds timeout)
{
    if (tasks.empty()) {
        return true;
    }

    auto latch = std::make_shared<Latch>();
    latch->remaining = tasks.size();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        for (auto& task : tasks) {
            tasks_.emplace([latch, work = std::move(task)] {
                if (work) {
                    work();
                }
                std::lock_guard<std::mutex> guard(latch->mutex);
                if (--latch->remaining == 0) {
                    latch->done.notify_all();
                }
            });
        }
    }
    condition_.notify_all();

    std::unique_lock<std::mutex> lock(latch->mutex);
    if (timeout.count() <= 0) {
        latch->done.wait(lock, [&latch] { return latch->remaining == 0; });
        return true;
    }
    return latch->done.wait_for(lock, timeout, [&latch] { return latch->remaining == 0; });
}

} // namespace fanlog::infra
