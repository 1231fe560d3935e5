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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives (String, Logger, WorkerPool).
 */

#include "mid64/infra/logger.hpp"
#include "mid64/infra/string.hpp"
#include "mid64/infra/worker_pool.hpp"
#include "framework.hpp"

#include <atomic>
#include <iostream>
#include <limits>
#include <new>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using mid64::infra::Logger;
using mid64::infra::LogLevel;
using mid64::infra::String;

namespace {

/**
 * @class CoutCapture
 * @brief RAII redirection of `std::cout` into a string buffer.
 */
class CoutCapture {
  public:
    CoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(previous_); }

    std::string str() const { return buffer_.str(); }

  private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

} // namespace

/**
 * @brief Tests `String::trim` with padded input.
 */
void test_string_trim()
{
    std::string dirty = "   14056685568000775 \n";
    std::string clean = String::trim(dirty);

    ASSERT_EQ(clean, std::string("14056685568000775"));
    ASSERT_EQ(String::trim("a b"), std::string("a b"));
}

/**
 * @brief Strings made only of whitespace collapse to empty.
 */
void test_string_trim_empty()
{
    std::string empty = "  \t\n  \r ";
    std::string result = String::trim(empty);

    ASSERT_EQ(result, std::string(""));
    ASSERT_EQ(String::trim(""), std::string(""));
}

/**
 * @brief `String::parse_u64` accepts plain decimal digits only.
 */
void test_string_parse_u64()
{
    std::optional<uint64_t> zero = String::parse_u64("0");
    ASSERT_TRUE(zero.has_value());
    ASSERT_EQ(*zero, static_cast<uint64_t>(0));

    std::optional<uint64_t> padded = String::parse_u64("007");
    ASSERT_TRUE(padded.has_value());
    ASSERT_EQ(*padded, static_cast<uint64_t>(7));

    std::optional<uint64_t> max = String::parse_u64("18446744073709551615");
    ASSERT_TRUE(max.has_value());
    ASSERT_EQ(*max, std::numeric_limits<uint64_t>::max());

    const std::vector<std::string> rejected = {
        "", "-1", "+1", " 1", "1 ", "1a", "0x10", "1.0", "18446744073709551616",
    };
    for (const std::string& text : rejected) {
        ASSERT_FALSE(String::parse_u64(text).has_value());
    }
}

/**
 * @brief Entries below the threshold are dropped; others reach stdout.
 */
void test_logger_threshold()
{
    LogLevel previous = Logger::level();
    std::string filtered;
    std::string written;
    {
        CoutCapture capture;
        Logger::set_level(LogLevel::WARN);
        Logger::log(LogLevel::INFO, "filtered entry");
        filtered = capture.str();

        Logger::set_level(LogLevel::DEBUG);
        Logger::log(LogLevel::DEBUG, "generator ready");
        written = capture.str();
    }
    Logger::set_level(previous);

    ASSERT_EQ(filtered, std::string(""));
    ASSERT_TRUE(written.find("[DBUG] generator ready") != std::string::npos);
}

/**
 * @brief `drain()` returns only after every queued task has run, and can be reused.
 */
void test_worker_pool_drain()
{
    std::atomic<int> executed{0};
    mid64::infra::WorkerPool pool(4);
    ASSERT_EQ(pool.size(), static_cast<size_t>(4));

    for (int i = 0; i < 100; ++i) {
        pool.enqueue([&executed] { executed.fetch_add(1); });
    }
    pool.drain();
    ASSERT_EQ(executed.load(), 100);

    for (int i = 0; i < 10; ++i) {
        pool.enqueue([&executed] { executed.fetch_add(1); });
    }
    pool.drain();
    ASSERT_EQ(executed.load(), 110);
}

/**
 * @brief A throwing task is logged and counted, and does not stop its worker.
 */
void test_worker_pool_survives_task_failure()
{
    LogLevel previous = Logger::level();
    Logger::set_level(LogLevel::FATAL);

    std::atomic<int> executed{0};
    size_t failed_before = 0;
    size_t failed_after = 0;
    {
        mid64::infra::WorkerPool pool(1);
        pool.enqueue([&executed] { executed.fetch_add(1); });
        pool.drain();
        failed_before = pool.failed_tasks();

        pool.enqueue([] { throw std::runtime_error("task failure"); });
        pool.enqueue([] { throw std::bad_alloc(); });
        pool.enqueue([&executed] { executed.fetch_add(1); });
        pool.drain();
        failed_after = pool.failed_tasks();
    }
    Logger::set_level(previous);

    ASSERT_EQ(executed.load(), 2);
    ASSERT_EQ(failed_before, static_cast<size_t>(0));
    ASSERT_EQ(failed_after, static_cast<size_t>(2));
}

/**
 * @brief A case throwing a non-`std::exception` value is recorded as failed.
 *
 * The nested run prints its own FAIL line; the counters are restored afterwards so
 * the suite summary only reflects real cases.
 */
void test_framework_counts_non_standard_exception()
{
    const int passed_before = mid64::test::passed_count;
    const int failed_before = mid64::test::failed_count;
    const size_t failures_before = mid64::test::failures.size();

    mid64::test::run("nested_throws_int", [] { throw 42; });

    const int failed_delta = mid64::test::failed_count - failed_before;
    const int passed_delta = mid64::test::passed_count - passed_before;
    const bool recorded = mid64::test::failures.size() == failures_before + 1 &&
                          mid64::test::failures.back() == "nested_throws_int";

    mid64::test::passed_count = passed_before;
    mid64::test::failed_count = failed_before;
    mid64::test::failures.resize(failures_before);

    ASSERT_EQ(failed_delta, 1);
    ASSERT_EQ(passed_delta, 0);
    ASSERT_TRUE(recorded);
}
