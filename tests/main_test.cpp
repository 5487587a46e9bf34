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
 * @file main_test.cpp
 * @brief Central orchestrator for the fanlog Test Suite.
 *
 * @details
 * This file serves as the main entry point for the testing environment. It
 * aggregates unit and integration tests across all subsystems:
 * Infrastructure, Core (levels, time formats, formatting, history, dispatch,
 * configuration) and Destinations.
 */

#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., infra_test.cpp, registry_test.cpp, etc.).

// Infrastructure Subsystem (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_string_split();
void test_string_case_helpers();
void test_scheduler_run_all();
void test_scheduler_timeout();
void test_scheduler_zero_threads();
void test_process_identity();

// Severity (severity_test.cpp)
void test_severity_order();
void test_severity_short_codes();
void test_severity_categories();
void test_severity_parse();

// Time Formats (time_format_test.cpp)
void test_render_default_pattern();
void test_render_fraction_digits();
void test_render_literals();
void test_builder_day_first();
void test_builder_literal_escaping();
void test_builder_millisecond_range();

// Formatting (formatter_test.cpp)
void test_format_exception_chain();
void test_format_foreign_cause();
void test_format_exception_ptr();
void test_format_structured_command();
void test_format_json_document();
void test_format_plain_values();
void test_format_full_line();

// History (history_test.cpp)
void test_history_drop_oldest();
void test_history_clear();
void test_history_zero_capacity();
void test_history_concurrent_append();

// Dispatcher (registry_test.cpp)
void test_registry_level_filter();
void test_registry_destination_toggle();
void test_registry_global_disable();
void test_registry_formats_once();
void test_registry_add_or_replace();
void test_registry_remove();
void test_registry_settings_validation();
void test_registry_failure_isolation();
void test_registry_sequential_order();
void test_registry_concurrent_delivery();
void test_registry_dispatch_timeout();
void test_registry_hung_destination_isolated();
void test_registry_history_lifecycle();
void test_registry_history_without_destinations();

// File Destination (file_destination_test.cpp)
void test_file_appends_full_lines();
void test_file_rotation_by_lines();
void test_file_concurrent_rotation();
void test_file_archive_failure_keeps_live_file();
void test_file_rotation_by_bytes();
void test_file_default_name();
void test_file_rejects_empty_settings();

// Other Destinations (sinks_test.cpp)
void test_console_requires_terminal();
void test_trace_writes_full_line();
void test_trace_shares_console_lock();
void test_trace_bad_stream_discarded();
void test_event_log_record();
void test_event_log_rejecting_channel();
void test_connection_descriptor_validation();
void test_database_row();
void test_mail_settings_validation();
void test_email_message();

// Configuration (config_test.cpp)
void test_config_apply_settings();
void test_config_disabled_destination();
void test_config_transports();
void test_config_rejects_invalid_documents();
void test_config_apply_file();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * Orchestrates the sequential execution of registered test cases.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating fanlog Test Suite...\033[0m" << std::endl;

    // --- 1. Infrastructure Subsystem Tests ---
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_split);
    RUN_TEST(test_string_case_helpers);
    RUN_TEST(test_scheduler_run_all);
    RUN_TEST(test_scheduler_timeout);
    RUN_TEST(test_scheduler_zero_threads);
    RUN_TEST(test_process_identity);

    // --- 2. Core Value Types ---
    RUN_TEST(test_severity_order);
    RUN_TEST(test_severity_short_codes);
    RUN_TEST(test_severity_categories);
    RUN_TEST(test_severity_parse);

    RUN_TEST(test_render_default_pattern);
    RUN_TEST(test_render_fraction_digits);
    RUN_TEST(test_render_literals);
    RUN_TEST(test_builder_day_first);
    RUN_TEST(test_builder_literal_escaping);
    RUN_TEST(test_builder_millisecond_range);

    RUN_TEST(test_format_exception_chain);
    RUN_TEST(test_format_foreign_cause);
    RUN_TEST(test_format_exception_ptr);
    RUN_TEST(test_format_structured_command);
    RUN_TEST(test_format_json_document);
    RUN_TEST(test_format_plain_values);
    RUN_TEST(test_format_full_line);

    RUN_TEST(test_history_drop_oldest);
    RUN_TEST(test_history_clear);
    RUN_TEST(test_history_zero_capacity);
    RUN_TEST(test_history_concurrent_append);

    // --- 3. Dispatcher Tests ---
    // Filtering, fan-out modes, failure isolation and history recording.
    RUN_TEST(test_registry_level_filter);
    RUN_TEST(test_registry_destination_toggle);
    RUN_TEST(test_registry_global_disable);
    RUN_TEST(test_registry_formats_once);
    RUN_TEST(test_registry_add_or_replace);
    RUN_TEST(test_registry_remove);
    RUN_TEST(test_registry_settings_validation);
    RUN_TEST(test_registry_failure_isolation);
    RUN_TEST(test_registry_sequential_order);
    RUN_TEST(test_registry_concurrent_delivery);
    RUN_TEST(test_registry_dispatch_timeout);
    RUN_TEST(test_registry_hung_destination_isolated);
    RUN_TEST(test_registry_history_lifecycle);
    RUN_TEST(test_registry_history_without_destinations);

    // --- 4. Destination Tests ---
    RUN_TEST(test_file_appends_full_lines);
    RUN_TEST(test_file_rotation_by_lines);
    RUN_TEST(test_file_concurrent_rotation);
    RUN_TEST(test_file_archive_failure_keeps_live_file);
    RUN_TEST(test_file_rotation_by_bytes);
    RUN_TEST(test_file_default_name);
    RUN_TEST(test_file_rejects_empty_settings);

    RUN_TEST(test_console_requires_terminal);
    RUN_TEST(test_trace_writes_full_line);
    RUN_TEST(test_trace_shares_console_lock);
    RUN_TEST(test_trace_bad_stream_discarded);
    RUN_TEST(test_event_log_record);
    RUN_TEST(test_event_log_rejecting_channel);
    RUN_TEST(test_connection_descriptor_validation);
    RUN_TEST(test_database_row);
    RUN_TEST(test_mail_settings_validation);
    RUN_TEST(test_email_message);

    // --- 5. Configuration Tests ---
    RUN_TEST(test_config_apply_settings);
    RUN_TEST(test_config_disabled_destination);
    RUN_TEST(test_config_transports);
    RUN_TEST(test_config_rejects_invalid_documents);
    RUN_TEST(test_config_apply_file);

    // Render the final results summary to stdout.
    fanlog::test::print_summary();

    // Signal exit status: Non-zero if failures occurred.
    return (fanlog::test::failed_count == 0) ? 0 : 1;
}
