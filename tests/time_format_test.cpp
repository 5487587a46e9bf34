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
 * @file time_format_test.cpp
 * @brief Unit tests for the time format builder and the timestamp renderer.
 *
 * @details
 * Rendering is checked against a fixed local instant (2024-03-05 07:08:09 plus
 * 0.1234567 s), so expectations do not depend on the host's time zone.
 */

#include "fanlog/core/error.hpp"
#include "fanlog/core/time_format.hpp"
#include "framework.hpp"

#include <chrono>
#include <ctime>
#include <string>

namespace {

std::chrono::system_clock::time_point fixed_instant()
{
    std::tm local{};
    local.tm_year = 2024 - 1900;
    local.tm_mon = 2;
    local.tm_mday = 5;
    local.tm_hour = 7;
    local.tm_min = 8;
    local.tm_sec = 9;
    local.tm_isdst = -1;

    auto base = std::chrono::system_clock::from_time_t(std::mktime(&local));
    return base + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                      std::chrono::nanoseconds(123456700));
}

} // namespace

/**
 * @brief The default pattern renders date, time and milliseconds.
 */
void test_render_default_pattern()
{
    std::string text = fanlog::core::render_timestamp(fanlog::core::kDefaultTimeFormat,
                                                      fixed_instant());
    ASSERT_EQ(text, std::string("2024-03-05 07:08:09.123"));
}

/**
 * @brief Fractions are truncated to the requested digit count, never rounded.
 */
void test_render_fraction_digits()
{
    auto when = fixed_instant();
    ASSERT_EQ(fanlog::core::render_timestamp("f", when), std::string("1"));
    ASSERT_EQ(fanlog::core::render_timestamp("fffff", when), std::string("12345"));
    ASSERT_EQ(fanlog::core::render_timestamp("fffffff", when), std::string("1234567"));
}

/**
 * @brief Quoted and escaped text is emitted verbatim.
 */
void test_render_literals()
{
    auto when = fixed_instant();
    ASSERT_EQ(fanlog::core::render_timestamp("yyyy'T'HH", when), std::string("2024T07"));
    ASSERT_EQ(fanlog::core::render_timestamp("HH\\h", when), std::string("07h"));
}

/**
 * @brief Builder output for the day-first layout.
 */
void test_builder_day_first()
{
    fanlog::core::TimeFormatBuilder builder;
    builder.day("/").month("/").year(" ").hour(":").minute(":").second(".").millisecond(7);

    ASSERT_EQ(builder.to_pattern(), std::string("dd/MM/yyyy HH:mm:ss.fffffff"));
    ASSERT_EQ(fanlog::core::render_timestamp(builder.to_pattern(), fixed_instant()),
              std::string("05/03/2024 07:08:09.1234567"));
}

/**
 * @brief Literal text containing pattern letters is escaped and renders verbatim.
 */
void test_builder_literal_escaping()
{
    fanlog::core::TimeFormatBuilder builder;
    builder.hour().literal(" hours").clear().day().literal(" -- at ").hour();

    ASSERT_EQ(fanlog::core::render_timestamp(builder.to_pattern(), fixed_instant()),
              std::string("05 -- at 07"));
}

void test_builder_millisecond_range()
{
    fanlog::core::TimeFormatBuilder builder;
    ASSERT_THROWS(builder.millisecond(0), fanlog::core::ConfigurationError);
    ASSERT_THROWS(builder.millisecond(8), fanlog::core::ConfigurationError);
    ASSERT_TRUE(builder.empty());

    builder.millisecond(1);
    ASSERT_EQ(builder.to_pattern(), std::string("f"));
}
