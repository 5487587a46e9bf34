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
 * @file payload.cpp
 * @brief Construction helpers for the structured payload shapes.
 */

#include "fanlog/core/payload.hpp"

namespace fanlog::core {

namespace {

void walk(const std::exception& error, std::vector<std::string>& messages)
{
    messages.emplace_back(error.what());
    try {
        std::rethrow_if_nested(error);
    } catch (const std::exception& cause) {
        walk(cause, messages);
    } catch (...) {
        messages.emplace_back("Unknown exception");
    }
}

} // namespace

ErrorChain ErrorChain::capture(const std::exception& error)
{
    ErrorChain chain;
    walk(error, chain.messages);
    return chain;
}

ErrorChain ErrorChain::capture(std::exception_ptr error)
{
    ErrorChain chain;
    if (!error) {
        return chain;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        walk(e, chain.messages);
    } catch (...) {
        chain.messages.emplace_back("Unknown exception");
    }
    return chain;
}

StructuredCommand& StructuredCommand::bind(std::string name, std::string value)
{
    parameters.emplace_back(std::move(name), std::move(value));
    return *this;
}

JsonDocument JsonDocument::copy_of(const cJSON* tree)
{
    JsonDocument document;
    if (tree) {
        document.root.reset(cJSON_Duplicate(tree, 1), cJSON_Delete);
    }
    return document;
}

} // namespace fanlog::core
