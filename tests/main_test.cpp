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
 * @brief Entry point of the MID64 test suite.
 *
 * @details
 * Runs the infrastructure, identifier, generator and codec test cases in order
 * and exits non-zero if any of them failed.
 */

#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Infrastructure (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_string_parse_u64();
void test_logger_threshold();
void test_worker_pool_drain();
void test_worker_pool_survives_task_failure();
void test_framework_counts_non_standard_exception();

// Identifier value type (mid_test.cpp)
void test_mid_field_round_trip();
void test_mid_field_extraction();
void test_mid_null_sentinel();
void test_mid_ordering_follows_fields();
void test_mid_text_rendering();
void test_mid_timestamp_conversion();
void test_mid_hash_structural();

// Generator (generator_test.cpp)
void test_generator_packs_fields();
void test_generator_counter_resets_each_millisecond();
void test_generator_same_millisecond_strictly_increasing();
void test_generator_system_clock_ordering();
void test_generator_tag_isolation();
void test_generator_counter_wraps_after_256();
void test_generator_clock_regression_not_corrected();
void test_generator_rejects_invalid_clocks();
void test_generator_never_returns_null();
void test_generator_concurrent_unique_within_capacity();

// Codecs (codec_test.cpp)
void test_bytes_big_endian_layout();
void test_bytes_round_trip();
void test_bytes_rejects_wrong_length();
void test_json_single_value();
void test_json_rejects_non_numbers();
void test_cjson_embedding();
void test_json_describe();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return 0 when every test passed, 1 otherwise.
 */
int main()
{
    std::cout << "\033[36mRunning MID64 Test Suite...\033[0m" << std::endl;

    // --- 1. Infrastructure ---
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_parse_u64);
    RUN_TEST(test_logger_threshold);
    RUN_TEST(test_worker_pool_drain);
    RUN_TEST(test_worker_pool_survives_task_failure);
    RUN_TEST(test_framework_counts_non_standard_exception);

    // --- 2. Identifier value type ---
    RUN_TEST(test_mid_field_round_trip);
    RUN_TEST(test_mid_field_extraction);
    RUN_TEST(test_mid_null_sentinel);
    RUN_TEST(test_mid_ordering_follows_fields);
    RUN_TEST(test_mid_text_rendering);
    RUN_TEST(test_mid_timestamp_conversion);
    RUN_TEST(test_mid_hash_structural);

    // --- 3. Generator (deterministic clocks, then concurrency) ---
    RUN_TEST(test_generator_packs_fields);
    RUN_TEST(test_generator_counter_resets_each_millisecond);
    RUN_TEST(test_generator_same_millisecond_strictly_increasing);
    RUN_TEST(test_generator_system_clock_ordering);
    RUN_TEST(test_generator_tag_isolation);
    RUN_TEST(test_generator_counter_wraps_after_256);
    RUN_TEST(test_generator_clock_regression_not_corrected);
    RUN_TEST(test_generator_rejects_invalid_clocks);
    RUN_TEST(test_generator_never_returns_null);
    RUN_TEST(test_generator_concurrent_unique_within_capacity);

    // --- 4. Codecs ---
    RUN_TEST(test_bytes_big_endian_layout);
    RUN_TEST(test_bytes_round_trip);
    RUN_TEST(test_bytes_rejects_wrong_length);
    RUN_TEST(test_json_single_value);
    RUN_TEST(test_json_rejects_non_numbers);
    RUN_TEST(test_cjson_embedding);
    RUN_TEST(test_json_describe);

    mid64::test::print_summary();

    return (mid64::test::failed_count == 0) ? 0 : 1;
}
