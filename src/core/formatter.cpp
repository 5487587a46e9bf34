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
 * @file formatter.cpp
 * @brief Default payload rendering and line composition.
 */

#include "fanlog/core/formatter.hpp"

#include "fanlog/core/time_format.hpp"

#include <cstdlib>

namespace fanlog::core {

namespace {

std::string render(const std::monostate&)
{
    return "";
}

std::string render(const std::string& text)
{
    return text;
}

std::string render(const ErrorChain& chain)
{
    std::string out;
    for (const auto& message : chain.messages) {
        out += message;
        out += '\n';
    }
    return out;
}

std::string render(const StructuredCommand& command)
{
    std::string out;
    out += "Command type: " + command.kind + "\n";
    out += "Command text: " + command.text + "\n";
    for (const auto& [name, value] : command.parameters) {
        out += name + ", " + value + "\n";
    }
    return out;
}

std::string render(const JsonDocument& document)
{
    if (!document.root) {
        return "";
    }

    char* raw = cJSON_PrintUnformatted(document.root.get());
    if (!raw) {
        return "";
    }
    std::string text(raw);
    free(raw);
    return text;
}

} // namespace

std::string MessageFormatter::format_body(const Payload& payload) const
{
    return std::visit([](const auto& alternative) { return render(alternative); },
                      payload.value());
}

std::string format_line(const LogEntry& entry, const std::string& time_pattern)
{
    std::string line = render_timestamp(time_pattern, entry.timestamp);
    line += " [";
    line += short_code(entry.level);
    line += "] ";
    line += entry.formatted_body;
    return line;
}

} // namespace fanlog::core
