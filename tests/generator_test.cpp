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
 * @file generator_test.cpp
 * @brief Unit and concurrency tests for `IdGenerator`.
 *
 * @details
 * A controllable clock pins the tick derivation and the bump-to-next-tick path;
 * the real clock is used for the sequential and multi-threaded uniqueness runs.
 */

#include "kid/core/id.hpp"
#include "kid/infra/id_generator.hpp"
#include "kid/infra/scheduler.hpp"
#include "framework.hpp"

#include <chrono>
#include <cstdint>
#include <unordered_set>
#include <vector>

using kid::infra::IdGenerator;
using kid::infra::Tick;

namespace {

constexpr std::int64_t kMilli = 1741456227757;

} // namespace

/**
 * @brief Sequence is the sub-millisecond remainder shifted right by 8.
 */
void test_generator_tick_derivation()
{
    std::int64_t now = kMilli * IdGenerator::kNanosPerMilli + 957440;
    IdGenerator gen([&now] { return now; });

    Tick t = gen.next_tick();
    ASSERT_EQ(t.milli, kMilli);
    ASSERT_EQ(t.seq, static_cast<std::int64_t>(957440 >> 8));

    // The clock moves forward into the next millisecond: no bump needed.
    now = (kMilli + 1) * IdGenerator::kNanosPerMilli + 4096;
    t = gen.next_tick();
    ASSERT_EQ(t.milli, kMilli + 1);
    ASSERT_EQ(t.seq, static_cast<std::int64_t>(16));
}

/**
 * @brief A stalled clock yields consecutive sequence numbers.
 */
void test_generator_stalled_clock()
{
    std::int64_t now = kMilli * IdGenerator::kNanosPerMilli + 957440;
    IdGenerator gen([&now] { return now; });

    Tick first = gen.next_tick();
    Tick second = gen.next_tick();
    Tick third = gen.next_tick();

    ASSERT_EQ(second.milli, first.milli);
    ASSERT_EQ(second.seq, first.seq + 1);
    ASSERT_EQ(third.seq, first.seq + 2);
    ASSERT_EQ(third.value(), first.value() + 2);
}

/**
 * @brief A clock that jumps backwards never produces a smaller tick.
 */
void test_generator_backwards_clock()
{
    std::int64_t now = kMilli * IdGenerator::kNanosPerMilli;
    IdGenerator gen([&now] { return now; });

    Tick before = gen.next_tick();
    now -= 5 * IdGenerator::kNanosPerMilli;
    Tick after = gen.next_tick();

    ASSERT_EQ(after.value(), before.value() + 1);
    ASSERT_EQ(after.milli, kMilli);
}

/**
 * @brief Bumping past sequence 4095 carries into the next millisecond.
 */
void test_generator_sequence_carry()
{
    // Remainder 999'999 ns maps to sequence 3906, the highest the clock produces.
    std::int64_t now = kMilli * IdGenerator::kNanosPerMilli + 999999;
    IdGenerator gen([&now] { return now; });

    Tick t = gen.next_tick();
    ASSERT_EQ(t.seq, static_cast<std::int64_t>(3906));

    for (int i = 0; i < 189; ++i) {
        t = gen.next_tick();
    }
    ASSERT_EQ(t.milli, kMilli);
    ASSERT_EQ(t.seq, static_cast<std::int64_t>(4095));

    t = gen.next_tick();
    ASSERT_EQ(t.milli, kMilli + 1);
    ASSERT_EQ(t.seq, static_cast<std::int64_t>(0));
}

/**
 * @brief `generate` packs the tick big-endian into bytes 0-7.
 */
void test_generator_packs_tick()
{
    std::int64_t now = 1741456227758LL * IdGenerator::kNanosPerMilli + 152 * 256;
    IdGenerator gen([&now] { return now; });

    kid::Id id = gen.generate();
    ASSERT_FALSE(id.is_nil());
    ASSERT_EQ(id.timestamp(), static_cast<std::int64_t>(1741456227758));
    ASSERT_EQ(id.sequence(), static_cast<std::uint16_t>(152));
    ASSERT_EQ(id.to_string().substr(0, 12), std::string("06bqer9xnr09"));
}

/**
 * @brief Real-clock identifiers are recent and distinct.
 */
void test_generator_real_clock()
{
    IdGenerator gen;
    const auto wall = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();

    kid::Id a = gen.generate();
    kid::Id b = gen.generate();

    ASSERT_FALSE(a.is_nil());
    ASSERT_NE(a, b);
    ASSERT_EQ(a.compare(b), -1);
    ASSERT_TRUE(a.timestamp() >= wall);
    ASSERT_TRUE(a.timestamp() - wall < 1000);
}

/**
 * @brief One million sequential identifiers are strictly ordered.
 *
 * Timestamps never decrease, and within one timestamp the sequence strictly
 * increases.
 */
void test_generator_sequential_million()
{
    IdGenerator gen;
    std::vector<kid::Id> ids;
    ids.reserve(1000000);
    for (int i = 0; i < 1000000; ++i) {
        ids.push_back(gen.generate());
    }

    for (std::size_t i = 1; i < ids.size(); ++i) {
        const kid::Id& prev = ids[i - 1];
        const kid::Id& cur = ids[i];
        ASSERT_TRUE(cur.timestamp() >= prev.timestamp());
        if (cur.timestamp() == prev.timestamp()) {
            ASSERT_TRUE(cur.sequence() > prev.sequence());
        }
    }
}

/**
 * @brief Concurrent callers never receive the same tick.
 *
 * Eight jobs on the worker pool share one generator. Each job's own sequence
 * must be strictly increasing and the union of all ticks must be duplicate-free.
 */
void test_generator_concurrent_unique()
{
    constexpr std::size_t kJobs = 8;
    constexpr std::size_t kPerJob = 20000;

    IdGenerator gen;
    std::vector<std::vector<kid::Id>> results(kJobs);
    {
        kid::infra::Scheduler scheduler(kJobs);
        for (std::size_t j = 0; j < kJobs; ++j) {
            scheduler.enqueue([&gen, &results, j] {
                results[j].reserve(kPerJob);
                for (std::size_t n = 0; n < kPerJob; ++n) {
                    results[j].push_back(gen.generate());
                }
            });
        }
        scheduler.wait_idle();
    }

    std::unordered_set<std::int64_t> ticks;
    std::unordered_set<kid::Id> ids;
    for (const auto& job : results) {
        ASSERT_EQ(job.size(), kPerJob);
        for (std::size_t n = 0; n < job.size(); ++n) {
            if (n > 0) {
                ASSERT_EQ(job[n].compare(job[n - 1]), 1);
            }
            ticks.insert(job[n].timestamp() * 65536 + job[n].sequence());
            ids.insert(job[n]);
        }
    }
    ASSERT_EQ(ticks.size(), kJobs * kPerJob);
    ASSERT_EQ(ids.size(), kJobs * kPerJob);
}
