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
 * @file uniqcheck.cpp
 * @brief Concurrent uniqueness check for the identifier generator.
 *
 * @details
 * Runs N jobs on the worker pool, each drawing M identifiers from one shared
 * `IdGenerator`, then verifies that
 * - every job saw strictly increasing (timestamp, sequence) values, and
 * - no (timestamp, sequence) pair was issued twice across all jobs.
 *
 * The random suffix is ignored, so a clean run shows the tick source alone
 * guarantees uniqueness.
 *
 * Usage:
 *   kid_uniqcheck --threads 5 --count 10000000
 */

#include "kid/core/id.hpp"
#include "kid/infra/id_generator.hpp"
#include "kid/infra/logger.hpp"
#include "kid/infra/scheduler.hpp"
#include "kid/infra/string.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

/// @brief Combined 64-bit ordering value of an identifier (first 8 bytes).
std::uint64_t tick_of(const kid::Id& id)
{
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        v = (v << 8) | id.bytes()[i];
    }
    return v;
}

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [--threads N] [--count M]\n"
              << "Options:\n"
              << "  --threads N   Number of concurrent jobs (Default: 4)\n"
              << "  --count M     IDs generated per job (Default: 1000000)\n"
              << "  --help        Show this help message\n";
}

} // namespace

int main(int argc, char* argv[])
{
    std::size_t threads = 4;
    std::size_t count = 1000000;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_help(argv[0]);
                return 0;
            }
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " requires a value");
            }
            if (arg == "--threads") {
                threads = std::stoul(argv[++i]);
            } else if (arg == "--count") {
                count = std::stoul(argv[++i]);
            } else {
                throw std::invalid_argument("unknown option " + arg);
            }
        }
        if (threads == 0 || count == 0) {
            throw std::invalid_argument("--threads and --count must be positive");
        }
    } catch (const std::exception& e) {
        std::cerr << "kid_uniqcheck: Error, invalid arguments (" << e.what() << ").\n";
        print_help(argv[0]);
        return 1;
    }

    using kid::infra::LogLevel;
    using kid::infra::Logger;
    using kid::infra::String;

    try {
        Logger::log(LogLevel::INFO, "uniqcheck: Generating " + String::group_thousands(count) +
                                        " IDs per " + std::to_string(threads) + " jobs");

        kid::infra::IdGenerator generator;
        std::vector<std::vector<kid::Id>> results(threads);
        std::vector<std::size_t> order_violations(threads, 0);

        std::size_t failed_jobs = 0;
        const auto start = std::chrono::steady_clock::now();
        {
            kid::infra::Scheduler scheduler(threads);
            for (std::size_t j = 0; j < threads; ++j) {
                scheduler.enqueue([&generator, &results, &order_violations, j, count] {
                    auto& out = results[j];
                    out.reserve(count);
                    for (std::size_t n = 0; n < count; ++n) {
                        out.push_back(generator.generate());
                        if (n > 0 && out[n].compare(out[n - 1]) <= 0) {
                            ++order_violations[j];
                        }
                    }
                });
            }
            scheduler.wait_idle();
            failed_jobs = scheduler.failed();
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        std::size_t short_jobs = 0;
        for (std::size_t j = 0; j < threads; ++j) {
            if (results[j].size() != count) {
                ++short_jobs;
            }
        }
        if (failed_jobs > 0 || short_jobs > 0) {
            Logger::log(LogLevel::ERROR, "uniqcheck: " + std::to_string(short_jobs) + " of " +
                                             std::to_string(threads) +
                                             " jobs did not complete (" +
                                             std::to_string(failed_jobs) + " failed)");
            return 1;
        }

        std::vector<std::uint64_t> ticks;
        ticks.reserve(threads * count);
        std::size_t violations = 0;
        for (std::size_t j = 0; j < threads; ++j) {
            violations += order_violations[j];
            for (const auto& id : results[j]) {
                ticks.push_back(tick_of(id));
            }
        }

        std::sort(ticks.begin(), ticks.end());
        std::size_t dupes = 0;
        for (std::size_t i = 1; i < ticks.size(); ++i) {
            if (ticks[i] == ticks[i - 1]) {
                ++dupes;
            }
        }

        std::cout << "Total keys: " << String::group_thousands(ticks.size())
                  << ". Elapsed: " << elapsed.count() << " ms"
                  << ". Number of dupes: " << String::group_thousands(dupes)
                  << ". Ordering violations: " << String::group_thousands(violations) << "\n";

        if (dupes > 0 || violations > 0) {
            Logger::log(LogLevel::ERROR, "uniqcheck: !!! Dupes or ordering violations detected !!!");
            return 1;
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "uniqcheck: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
