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
 * @file history.hpp
 * @brief Bounded in-memory record of recently formatted lines.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace fanlog::core {

/**
 * @class HistoryBuffer
 * @brief Fixed-capacity FIFO with drop-oldest eviction.
 *
 * @details
 * Appending to a full buffer evicts exactly the oldest line. All operations are
 * serialized by an internal mutex, so concurrent dispatches may append while
 * another thread takes a snapshot.
 */
class HistoryBuffer {
  public:
    /**
     * @param capacity Maximum number of retained lines.
     * @throws ConfigurationError if @p capacity is zero.
     */
    explicit HistoryBuffer(std::size_t capacity);

    void append(std::string line);

    void clear();

    /**
     * @brief Copies the current contents, oldest first.
     *
     * The returned sequence is independent of the buffer: later appends or
     * clears do not affect it.
     */
    std::vector<std::string> snapshot() const;

    std::size_t size() const;

    std::size_t capacity() const noexcept { return capacity_; }

  private:
    const std::size_t capacity_;
    std::deque<std::string> lines_;
    mutable std::mutex mutex_;
};

} // namespace fanlog::core
