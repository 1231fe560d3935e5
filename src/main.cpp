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
 * @brief Entry point of the `mid64` command-line tool.
 *
 * @details
 * Sub-commands:
 * 1. `generate`: mint identifiers from the process-wide generator (default).
 * 2. `inspect`: decode raw identifier values into their fields.
 * 3. `stress`: hammer the shared generator from a worker pool and report collisions.
 */

#include "mid64/codec/bytes.hpp"
#include "mid64/codec/json.hpp"
#include "mid64/core/generator.hpp"
#include "mid64/core/mid.hpp"
#include "mid64/infra/logger.hpp"
#include "mid64/infra/string.hpp"
#include "mid64/infra/worker_pool.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using mid64::infra::LogLevel;
using mid64::infra::Logger;

namespace {

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [--verbose|--quiet] [COMMAND] [OPTIONS]\n"
              << "Commands:\n"
              << "  generate [--count N] [--tag T] [--json]\n"
              << "              Mint N identifiers (default 1) with tag T (0-255, default 0)\n"
              << "  inspect VALUE... [--json]\n"
              << "              Decode raw decimal identifiers into timestamp, counter and tag\n"
              << "  stress [--threads N] [--per-thread M] [--tag T]\n"
              << "              Generate concurrently and report duplicate identifiers\n"
              << "Options:\n"
              << "  --verbose   Log debug output\n"
              << "  --quiet     Log warnings and errors only\n"
              << "  --help      Show this help message\n";
}

/// @brief Parses a non-negative option value, bounded by `max`.
uint64_t parse_number(const std::string& option, const std::string& text, uint64_t max)
{
    std::optional<uint64_t> value = mid64::infra::String::parse_u64(text);
    if (!value || *value > max) {
        throw std::invalid_argument("Invalid value '" + text + "' for " + option +
                                    " (expected 0-" + std::to_string(max) + ")");
    }
    return *value;
}

/// @brief Returns the argument following `args[i]`, advancing `i`.
const std::string& option_value(const std::vector<std::string>& args, size_t& i)
{
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + args[i]);
    }
    return args[++i];
}

int run_generate(const std::vector<std::string>& args)
{
    uint64_t count = 1;
    uint8_t tag = 0;
    bool json = false;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--count") {
            count = parse_number("--count", option_value(args, i), 1000000);
        } else if (args[i] == "--tag") {
            tag = static_cast<uint8_t>(parse_number("--tag", option_value(args, i), 255));
        } else if (args[i] == "--json") {
            json = true;
        } else {
            throw std::invalid_argument("Unknown generate option: " + args[i]);
        }
    }

    Logger::log(LogLevel::DEBUG, "Generate: count=" + std::to_string(count) +
                                     " tag=" + std::to_string(tag));

    mid64::core::Generator& generator = mid64::core::Generator::shared();
    for (uint64_t n = 0; n < count; ++n) {
        mid64::core::Mid id = generator.next(tag);
        if (json) {
            std::cout << mid64::codec::describe(id) << "\n";
        } else {
            std::cout << id << "\n";
        }
    }
    std::cout << std::flush;
    return 0;
}

int run_inspect(const std::vector<std::string>& args)
{
    bool json = false;
    std::vector<mid64::core::Mid> ids;

    for (const std::string& arg : args) {
        if (arg == "--json") {
            json = true;
            continue;
        }
        std::optional<uint64_t> raw = mid64::infra::String::parse_u64(arg);
        if (!raw) {
            throw std::invalid_argument("Not a decimal 64-bit identifier: " + arg);
        }
        ids.emplace_back(*raw);
    }

    if (ids.empty()) {
        throw std::invalid_argument("inspect requires at least one VALUE");
    }

    for (const mid64::core::Mid& id : ids) {
        if (json) {
            std::cout << mid64::codec::describe(id) << "\n";
            continue;
        }
        std::cout << id << (id.is_null() ? " (null)" : "") << "\n"
                  << "  timestamp: " << id.to_iso8601() << " (+" << id.millis() << " ms)\n"
                  << "  counter:   " << static_cast<unsigned>(id.counter()) << "\n"
                  << "  tag:       " << static_cast<unsigned>(id.tag()) << "\n"
                  << "  bytes:     " << mid64::codec::to_hex(mid64::codec::to_bytes(id)) << "\n";
    }
    std::cout << std::flush;
    return 0;
}

/**
 * @brief Runs `threads x per_thread` generations against the shared generator.
 *
 * Each task writes into its own slot so workers never share a container; the
 * results are merged and checked for duplicates after `drain()`. A task that
 * throws (e.g. `std::bad_alloc` on a huge run) fails the whole command.
 */
int run_stress(const std::vector<std::string>& args)
{
    uint64_t threads = std::max(1u, std::thread::hardware_concurrency());
    uint64_t per_thread = 1000;
    uint8_t tag = 0;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--threads") {
            threads = parse_number("--threads", option_value(args, i), 1024);
        } else if (args[i] == "--per-thread") {
            per_thread = parse_number("--per-thread", option_value(args, i), 10000000);
        } else if (args[i] == "--tag") {
            tag = static_cast<uint8_t>(parse_number("--tag", option_value(args, i), 255));
        } else {
            throw std::invalid_argument("Unknown stress option: " + args[i]);
        }
    }
    if (threads == 0) {
        throw std::invalid_argument("--threads must be at least 1");
    }

    Logger::log(LogLevel::INFO, "Stress: " + std::to_string(threads) + " workers x " +
                                    std::to_string(per_thread) + " identifiers");

    mid64::core::Generator& generator = mid64::core::Generator::shared();
    std::vector<std::vector<uint64_t>> slots(threads);

    size_t failed_tasks = 0;
    auto started = std::chrono::steady_clock::now();
    {
        mid64::infra::WorkerPool pool(threads);
        for (auto& slot : slots) {
            pool.enqueue([&generator, &slot, per_thread, tag] {
                slot.reserve(per_thread);
                for (uint64_t n = 0; n < per_thread; ++n) {
                    slot.push_back(generator.generate(tag));
                }
            });
        }
        pool.drain();
        failed_tasks = pool.failed_tasks();
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (failed_tasks > 0) {
        Logger::log(LogLevel::ERROR, "Stress: " + std::to_string(failed_tasks) + " of " +
                                         std::to_string(threads) +
                                         " workers failed; results are incomplete");
        return 1;
    }

    std::vector<uint64_t> all;
    all.reserve(threads * per_thread);
    for (const auto& slot : slots) {
        all.insert(all.end(), slot.begin(), slot.end());
    }
    std::sort(all.begin(), all.end());

    uint64_t duplicates = 0;
    uint64_t distinct_millis = 0;
    for (size_t i = 0; i < all.size(); ++i) {
        if (i > 0 && all[i] == all[i - 1]) {
            ++duplicates;
        }
        if (i == 0 || mid64::core::Mid(all[i]).millis() != mid64::core::Mid(all[i - 1]).millis()) {
            ++distinct_millis;
        }
    }

    Logger::log(LogLevel::INFO, "Stress: " + std::to_string(all.size()) + " identifiers across " +
                                    std::to_string(distinct_millis) + " ms in " +
                                    std::to_string(elapsed.count()) + " ms wall time");
    if (duplicates > 0) {
        Logger::log(LogLevel::WARN,
                    "Stress: " + std::to_string(duplicates) +
                        " duplicates (more than 256 identifiers per tag within one millisecond)");
    }
    if (generator.clock_regressions() > 0) {
        Logger::log(LogLevel::WARN, "Stress: clock regressed " +
                                        std::to_string(generator.clock_regressions()) +
                                        " times during the run");
    }

    std::cout << "generated=" << all.size() << " duplicates=" << duplicates
              << " milliseconds=" << distinct_millis << std::endl;
    return 0;
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 *
 * @return 0 on success, 1 on runtime failure, 2 on usage errors.
 */
int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);

    // Global flags may precede the command.
    size_t first = 0;
    while (first < args.size() && args[first].rfind("--", 0) == 0) {
        if (args[first] == "--help") {
            print_help(argv[0]);
            return 0;
        } else if (args[first] == "--verbose") {
            Logger::set_level(LogLevel::DEBUG);
        } else if (args[first] == "--quiet") {
            Logger::set_level(LogLevel::WARN);
        } else {
            break;
        }
        ++first;
    }

    std::string command = "generate";
    if (first < args.size() && args[first].rfind("--", 0) != 0) {
        command = args[first++];
    }
    std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(first), args.end());

    try {
        if (command == "generate") {
            return run_generate(rest);
        } else if (command == "inspect") {
            return run_inspect(rest);
        } else if (command == "stress") {
            return run_stress(rest);
        }
        throw std::invalid_argument("Unknown command: " + command);
    } catch (const std::invalid_argument& e) {
        Logger::log(LogLevel::ERROR, std::string(e.what()));
        print_help(argv[0]);
        return 2;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "Critical Failure: " + std::string(e.what()));
        return 1;
    } catch (...) {
        Logger::log(LogLevel::FATAL, "Unknown unhandled exception occurred.");
        return 1;
    }
}
