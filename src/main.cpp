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
 * @file main.cpp
 * @brief Demonstration driver for the fanlog registry.
 *
 * @details
 * Runs a scripted session against a registry:
 * 1. Argument Parsing.
 * 2. Registry Bootstrap (built-in destinations, or a JSON configuration file).
 * 3. Scripted Session (levels, exception chains, toggles, time formats).
 * 4. History Dump.
 */

#include "fanlog/core/config.hpp"
#include "fanlog/core/registry.hpp"
#include "fanlog/infra/logger.hpp"
#include "fanlog/sinks/console_destination.hpp"
#include "fanlog/sinks/event_log_destination.hpp"
#include "fanlog/sinks/file_destination.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using fanlog::core::Severity;

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [LOG_DIR] [CONFIG_JSON]\n"
              << "Options:\n"
              << "  LOG_DIR       Directory for the file destination (Default: ./fanlog_logs)\n"
              << "  CONFIG_JSON   Configuration file replacing the built-in destinations\n"
              << "  --help        Show this help message\n";
}

/**
 * @brief Registers the built-in demonstration destinations.
 */
void add_default_destinations(fanlog::core::Registry& logger, const std::string& log_dir)
{
    if (fanlog::sinks::ConsoleDestination::interactive()) {
        logger.add_or_replace(std::make_shared<fanlog::sinks::ConsoleDestination>("Console"));
    }

    auto file = std::make_shared<fanlog::sinks::FileDestination>("File", log_dir);
    file->set_max_lines(20);
    file->set_max_bytes(100 * 1024);

    logger.add_or_replace(std::make_shared<fanlog::sinks::TraceDestination>("Trace"))
        .add_or_replace(file)
        .add_or_replace(std::make_shared<fanlog::sinks::EventLogDestination>("EventLog"));
}

/**
 * @brief Raises a three-level exception chain: msg1 <- inner1 <- inner2.
 */
void raise_chain()
{
    try {
        try {
            throw std::runtime_error("inner2");
        } catch (const std::exception&) {
            std::throw_with_nested(std::runtime_error("inner1"));
        }
    } catch (const std::exception&) {
        std::throw_with_nested(std::runtime_error("msg1"));
    }
}

void print_history(const fanlog::core::Registry& logger)
{
    for (const auto& line : logger.history_snapshot()) {
        std::cout << line << std::endl;
    }
}

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    // 0. Argument Pre-check
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    // 1. Configuration Defaults
    std::string log_dir = "./fanlog_logs";
    std::string config_path;

    if (argc > 1)
        log_dir = argv[1];
    if (argc > 2)
        config_path = argv[2];

    fanlog::infra::Logger::set_enabled(true);

    try {
        // 2. Registry Bootstrap
        fanlog::core::Registry logger;
        logger.set_concurrent_dispatch(true);

        if (config_path.empty()) {
            fanlog::infra::Logger::log(Severity::Info, "Demo: log directory '" + log_dir + "'");
            add_default_destinations(logger, log_dir);
        } else {
            fanlog::infra::Logger::log(Severity::Info, "Demo: loading '" + config_path + "'");
            fanlog::core::ConfigLoader().apply_file(logger, config_path);
        }

        for (const auto& id : logger.identifiers()) {
            fanlog::infra::Logger::log(Severity::Info, "Demo: destination " +
                                                           logger.find(id)->describe());
        }

        logger.enable_history();
        print_history(logger);

        // 3. Scripted Session
        try {
            raise_chain();
        } catch (const std::exception& e) {
            logger.info(e);
        }
        logger.error("Error message");

        logger.disable();
        logger.debug("Debug when disabled");
        logger.enable();

        logger.debug("Debug");
        logger.critical("Critical");

        logger.disable("File");
        logger.info("File destination disabled");
        logger.enable("File");

        logger.clear_history();

        logger.set_minimum_level("File", Severity::Critical);
        logger.info("File destination level changed to Critical");
        logger.critical("Critical message");
        logger.set_minimum_level("File", Severity::Info);

        fanlog::core::TimeFormatBuilder format;
        format.day("/").month("/").year(" ").hour(":").minute(":").second(".").millisecond(7);
        logger.set_time_format(format);
        logger.info("Time format changed");

        format.clear().day("/").month("/").year().literal(" -- ").hour(":").minute(":").second(".")
            .millisecond(5);
        logger.set_time_format(format);
        logger.info("Time format changed again");

        // 4. History Dump
        print_history(logger);

        fanlog::infra::Logger::log(Severity::Info,
                                   "Demo: " + std::to_string(logger.discarded_writes()) +
                                       " write(s) discarded");
    } catch (const std::exception& e) {
        fanlog::infra::Logger::log(Severity::Critical,
                                   "Demo: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
