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
 * @file severity_test.cpp
 * @brief Unit tests for severity ordering, codes and parsing.
 */

#include "fanlog/core/error.hpp"
#include "fanlog/core/severity.hpp"
#include "framework.hpp"

#include <string>

using fanlog::core::EventCategory;
using fanlog::core::Severity;

/**
 * @brief Levels are totally ordered Debug < Info < Warn < Error < Critical.
 */
void test_severity_order()
{
    ASSERT_TRUE(fanlog::core::rank(Severity::Debug) < fanlog::core::rank(Severity::Info));
    ASSERT_TRUE(fanlog::core::rank(Severity::Info) < fanlog::core::rank(Severity::Warn));
    ASSERT_TRUE(fanlog::core::rank(Severity::Warn) < fanlog::core::rank(Severity::Error));
    ASSERT_TRUE(fanlog::core::rank(Severity::Error) < fanlog::core::rank(Severity::Critical));

    ASSERT_TRUE(fanlog::core::at_least(Severity::Error, Severity::Warn));
    ASSERT_TRUE(fanlog::core::at_least(Severity::Warn, Severity::Warn));
    ASSERT_FALSE(fanlog::core::at_least(Severity::Info, Severity::Warn));
}

void test_severity_short_codes()
{
    ASSERT_EQ(std::string(fanlog::core::short_code(Severity::Debug)), std::string("DBG"));
    ASSERT_EQ(std::string(fanlog::core::short_code(Severity::Info)), std::string("INF"));
    ASSERT_EQ(std::string(fanlog::core::short_code(Severity::Warn)), std::string("WRN"));
    ASSERT_EQ(std::string(fanlog::core::short_code(Severity::Error)), std::string("ERR"));
    ASSERT_EQ(std::string(fanlog::core::short_code(Severity::Critical)), std::string("CRT"));
}

/**
 * @brief Event log categories collapse five levels into three.
 */
void test_severity_categories()
{
    ASSERT_TRUE(fanlog::core::category(Severity::Debug) == EventCategory::Informational);
    ASSERT_TRUE(fanlog::core::category(Severity::Info) == EventCategory::Informational);
    ASSERT_TRUE(fanlog::core::category(Severity::Warn) == EventCategory::Warning);
    ASSERT_TRUE(fanlog::core::category(Severity::Error) == EventCategory::Error);
    ASSERT_TRUE(fanlog::core::category(Severity::Critical) == EventCategory::Error);
}

/**
 * @brief Parsing is case-insensitive and accepts names, codes and aliases.
 */
void test_severity_parse()
{
    ASSERT_TRUE(fanlog::core::parse_severity("debug") == Severity::Debug);
    ASSERT_TRUE(fanlog::core::parse_severity(" INFO ") == Severity::Info);
    ASSERT_TRUE(fanlog::core::parse_severity("Warning") == Severity::Warn);
    ASSERT_TRUE(fanlog::core::parse_severity("err") == Severity::Error);
    ASSERT_TRUE(fanlog::core::parse_severity("fatal") == Severity::Critical);

    ASSERT_THROWS(fanlog::core::parse_severity("verbose"), fanlog::core::ConfigurationError);
    ASSERT_THROWS(fanlog::core::parse_severity(""), fanlog::core::ConfigurationError);
}
