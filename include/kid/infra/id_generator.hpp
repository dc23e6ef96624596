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
 * @file id_generator.hpp
 * @brief Monotonic generator of k-sortable identifiers.
 *
 * @details
 * This file declares the `IdGenerator` class, the only stateful component of the
 * library. It owns the last issued tick and the mutex protecting it. A process
 * constructs one generator at startup and hands it by reference to every caller
 * that needs identifiers; there is no hidden global instance.
 */

#pragma once

#include "kid/core/id.hpp"

#include <cstdint>
#include <functional>
#include <mutex>

namespace kid::infra {

/**
 * @struct Tick
 * @brief One issued (timestamp, sequence) pair.
 */
struct Tick {
    std::int64_t milli; ///< Milliseconds since the Unix epoch.
    std::int64_t seq;   ///< Sequence within that millisecond, 0..4095.

    /// @brief The combined ordering value `milli << 12 | seq`.
    std::int64_t value() const { return (milli << 12) + seq; }
};

/**
 * @class IdGenerator
 * @brief Thread-safe source of strictly increasing ticks and new identifiers.
 *
 * @details
 * Every tick returned by `next_tick()` has a combined value strictly greater than
 * every tick this generator returned before, whatever the clock does. The clock
 * is injected so tests can pin or rewind time.
 *
 * **Known limitation:** the sequence is derived from the sub-millisecond part of
 * the clock (`remainder_ns >> 8`). On a clock without sub-millisecond resolution
 * every call in the same millisecond takes the `last_tick + 1` path, and under
 * sustained load the reported timestamp can run ahead of wall-clock time.
 */
class IdGenerator {
  public:
    /// @brief Returns nanoseconds since the Unix epoch.
    using Clock = std::function<std::int64_t()>;

    /// @brief Nanoseconds per millisecond.
    static constexpr std::int64_t kNanosPerMilli = 1000000;

    /// @brief Width of the sequence field inside a tick.
    static constexpr int kSequenceBits = 12;

    /**
     * @brief Creates a generator reading `std::chrono::system_clock`.
     */
    IdGenerator();

    /**
     * @brief Creates a generator reading the supplied clock.
     *
     * @param clock Callable returning nanoseconds since the Unix epoch. It is
     * invoked while the generator's lock is held.
     */
    explicit IdGenerator(Clock clock);

    IdGenerator(const IdGenerator&) = delete;
    IdGenerator& operator=(const IdGenerator&) = delete;

    /**
     * @brief Issues the next (timestamp, sequence) pair.
     *
     * The whole read-compare-update runs under `mutex_`. Never fails.
     */
    Tick next_tick();

    /**
     * @brief Builds a new identifier.
     *
     * Takes one tick, packs it into bytes 0-7 and fills bytes 8-9 from the
     * calling thread's `std::random_device`. Only `next_tick()` is serialized.
     *
     * @code
     * kid::infra::IdGenerator gen;
     * kid::Id id = gen.generate();
     * std::cout << id << "\n"; // e.g. 06bq7xhnr03mlz6r
     * @endcode
     */
    Id generate();

  private:
    Clock clock_;
    std::mutex mutex_;
    std::int64_t last_tick_;
};

} // namespace kid::infra
