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
 * @file history.cpp
 * @brief Implementation of the drop-oldest history buffer.
 */

#include "fanlog/core/history.hpp"

#include "fanlog/core/error.hpp"

namespace fanlog::core {

HistoryBuffer::HistoryBuffer(std::size_t capacity) : capacity_(capacity)
{
    if (capacity_ == 0) {
        throw ConfigurationError("History capacity must be at least 1");
    }
}

void HistoryBuffer::append(std::string line)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (lines_.size() >= capacity_) {
        lines_.pop_front();
    }
    lines_.push_back(std::move(line));
}

void HistoryBuffer::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

std::vector<std::string> HistoryBuffer::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(lines_.begin(), lines_.end());
}

std::size_t HistoryBuffer::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

} // namespace fanlog::core
