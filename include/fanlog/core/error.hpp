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
 * @file error.hpp
 * @brief Exception types raised by fanlog.
 *
 * @details
 * Two kinds of failure exist. `ConfigurationError` is thrown synchronously to the
 * caller that constructed a destination or mutated a registry setting with invalid
 * input. `WriteFailure` is thrown inside a destination's write path and never
 * leaves the destination boundary (see `fanlog::sinks::attempt`).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace fanlog::core {

/**
 * @class ConfigurationError
 * @brief Invalid construction or mutation input.
 *
 * Examples: empty destination identifier, millisecond digit count outside
 * [1,7], malformed connection descriptor, missing e-mail recipient, console
 * destination created without a terminal.
 */
class ConfigurationError : public std::invalid_argument {
  public:
    explicit ConfigurationError(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * @class WriteFailure
 * @brief A destination could not deliver an entry.
 *
 * Only ever observed by the attempt policy at the destination boundary.
 */
class WriteFailure : public std::runtime_error {
  public:
    explicit WriteFailure(const std::string& message) : std::runtime_error(message) {}
};

} // namespace fanlog::core
