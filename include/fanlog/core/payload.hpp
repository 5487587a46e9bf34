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
 * @file payload.hpp
 * @brief The polymorphic message carried by a log entry.
 *
 * @details
 * A `Payload` is a closed tagged union over the message shapes the formatter
 * understands:
 *
 * - **empty** (`std::monostate`): renders as the empty string.
 * - **text** (`std::string`): plain values; strings verbatim, arithmetic and
 *   other streamable values through `operator<<` at construction.
 * - **ErrorChain**: an exception and its `std::nested_exception` causes.
 * - **StructuredCommand**: a parameterized command (e.g. an SQL statement with
 *   bound parameters).
 * - **JsonDocument**: a cJSON tree, rendered compactly.
 *
 * Leveled log methods take a `Payload` by value, so call sites pass any of these
 * shapes directly: `registry.info("started")`, `registry.error(ex)`,
 * `registry.debug(42)`.
 */

#pragma once

#include <cJSON.h>
#include <exception>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace fanlog::core {

/**
 * @struct ErrorChain
 * @brief The message text of an exception and of each of its nested causes.
 *
 * `messages.front()` is the outermost exception. Causes are discovered through
 * `std::rethrow_if_nested`, i.e. chains built with `std::throw_with_nested`.
 */
struct ErrorChain {
    std::vector<std::string> messages;

    /// @brief Walks @p error and its nested causes.
    static ErrorChain capture(const std::exception& error);

    /// @brief Walks the exception held by @p error (empty chain for `nullptr`).
    static ErrorChain capture(std::exception_ptr error);
};

/**
 * @struct StructuredCommand
 * @brief A command description with bound parameters.
 *
 * Parameters keep their insertion order, which is the order the formatter emits.
 */
struct StructuredCommand {
    std::string kind; ///< e.g. "Text", "StoredProcedure".
    std::string text; ///< The literal command text.
    std::vector<std::pair<std::string, std::string>> parameters;

    /// @brief Appends a bound parameter and returns the command for chaining.
    StructuredCommand& bind(std::string name, std::string value);
};

/**
 * @struct JsonDocument
 * @brief Owning handle to a private copy of a cJSON tree.
 */
struct JsonDocument {
    std::shared_ptr<cJSON> root;

    /// @brief Deep-copies @p tree (nullptr yields an empty document).
    static JsonDocument copy_of(const cJSON* tree);
};

/**
 * @class Payload
 * @brief Tagged union over every message shape accepted by the registry.
 */
class Payload {
  public:
    using Variant =
        std::variant<std::monostate, std::string, ErrorChain, StructuredCommand, JsonDocument>;

    Payload() = default;

    Payload(std::string text) : value_(std::move(text)) {}

    /// @brief `nullptr` is the empty payload.
    Payload(const char* text)
    {
        if (text) {
            value_ = std::string(text);
        }
    }

    Payload(std::string_view text) : value_(std::string(text)) {}

    Payload(ErrorChain chain) : value_(std::move(chain)) {}
    Payload(StructuredCommand command) : value_(std::move(command)) {}
    Payload(JsonDocument document) : value_(std::move(document)) {}

    /// @brief Captures the exception currently held by @p error with its causes.
    Payload(std::exception_ptr error) : value_(ErrorChain::capture(std::move(error))) {}

    /// @brief Captures @p error with its nested causes.
    template <typename E,
              std::enable_if_t<std::is_base_of_v<std::exception, std::decay_t<E>>, int> = 0>
    Payload(const E& error) : value_(ErrorChain::capture(error))
    {
    }

    /// @brief Generic text conversion of arithmetic values.
    template <typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
    Payload(T value)
    {
        std::ostringstream out;
        if constexpr (std::is_same_v<T, bool>) {
            out << std::boolalpha;
        }
        out << value;
        value_ = out.str();
    }

    /// @brief Generic text conversion of any other streamable value.
    template <typename T>
    static Payload of(const T& value)
    {
        std::ostringstream out;
        out << value;
        return Payload(out.str());
    }

    const Variant& value() const noexcept { return value_; }

    bool empty() const noexcept { return std::holds_alternative<std::monostate>(value_); }

  private:
    Variant value_;
};

} // namespace fanlog::core
