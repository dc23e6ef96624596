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
 * @file id_generator.cpp
 * @brief Implementation of the monotonic tick source and identifier assembly.
 *
 * @details
 * Ticks follow the UUIDv7-style scheme of 52 bits of milliseconds plus 12 bits
 * of scaled sub-millisecond time, bumped by one whenever the clock has not moved
 * past the previous tick.
 */

#include "kid/infra/id_generator.hpp"

#include "kid/infra/logger.hpp"

#include <chrono>
#include <exception>
#include <random>
#include <utility>

namespace kid::infra {

namespace {

std::int64_t system_nanos()
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief Fills the random suffix of an identifier.
 *
 * Each thread keeps its own `std::random_device`, so no lock is taken here.
 * If the device fails the bytes stay zero and the identifier is still issued.
 */
void fill_random(std::uint8_t* dst, std::size_t len)
{
    try {
        static thread_local std::random_device rd;
        std::uniform_int_distribution<unsigned> byte(0, 0xFF);
        for (std::size_t i = 0; i < len; ++i) {
            dst[i] = static_cast<std::uint8_t>(byte(rd));
        }
    } catch (const std::exception& e) {
        for (std::size_t i = 0; i < len; ++i) {
            dst[i] = 0;
        }
        Logger::log(LogLevel::WARN,
                    "IdGenerator: random source failed (" + std::string(e.what()) + ")");
    }
}

} // namespace

IdGenerator::IdGenerator() : IdGenerator(system_nanos) {}

IdGenerator::IdGenerator(Clock clock) : clock_(std::move(clock)), last_tick_(0) {}

/**
 * @brief Issues a tick strictly greater than every previous one.
 *
 * Steps, all under the lock:
 * 1. Read the clock in nanoseconds.
 * 2. Split into whole milliseconds and a 0..3906 sequence (`remainder >> 8`).
 * 3. Combine as `milli << 12 + seq`.
 * 4. If that does not exceed the last tick, use `last_tick + 1` and split it back.
 * 5. Remember the result.
 */
Tick IdGenerator::next_tick()
{
    std::lock_guard<std::mutex> lock(mutex_);

    const std::int64_t nano = clock_();
    std::int64_t milli = nano / kNanosPerMilli;
    std::int64_t seq = (nano - milli * kNanosPerMilli) >> 8;
    std::int64_t now = (milli << kSequenceBits) + seq;

    if (now <= last_tick_) {
        now = last_tick_ + 1;
        milli = now >> kSequenceBits;
        seq = now & 0xFFF;
    }
    last_tick_ = now;

    return Tick{milli, seq};
}

Id IdGenerator::generate()
{
    const Tick t = next_tick();

    Id::Bytes b{};
    // Timestamp, 6 bytes, big-endian.
    b[0] = static_cast<std::uint8_t>(t.milli >> 40);
    b[1] = static_cast<std::uint8_t>(t.milli >> 32);
    b[2] = static_cast<std::uint8_t>(t.milli >> 24);
    b[3] = static_cast<std::uint8_t>(t.milli >> 16);
    b[4] = static_cast<std::uint8_t>(t.milli >> 8);
    b[5] = static_cast<std::uint8_t>(t.milli);
    // Sequence, 2 bytes, big-endian.
    b[6] = static_cast<std::uint8_t>(t.seq >> 8);
    b[7] = static_cast<std::uint8_t>(t.seq);

    fill_random(&b[8], 2);
    return Id(b);
}

} // namespace kid::infra
