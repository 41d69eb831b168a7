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
 * @file v1_generator.hpp
 * @brief Time-and-node based (version 1) identifier generation.
 *
 * @details
 * Host clocks commonly resolve to 1-15 ms, far coarser than the 100 ns unit of an
 * RFC 4122 timestamp. The `V1Generator` compensates with a synthetic sub-millisecond
 * `tick` that is advanced at random within one millisecond, and a 14-bit clock
 * `sequence` that is bumped whenever the tick cannot be advanced or the clock steps
 * backwards. Together they keep identifiers from one generator distinct and
 * approximately time ordered without ever blocking for the clock.
 */

#pragma once

#include "uuidforge/core/identifier.hpp"
#include "uuidforge/infra/clock.hpp"
#include "uuidforge/infra/config.hpp"
#include "uuidforge/infra/random_source.hpp"

#include <cstdint>
#include <mutex>

namespace uuidforge::core {

/**
 * @struct V1State
 * @brief The mutable continuity state behind version 1 generation.
 */
struct V1State {
    /// Last observed calendar time, in milliseconds since the Unix epoch.
    std::int64_t timestamp = 0;

    /// 14-bit clock sequence (masked on every generation).
    std::uint32_t sequence = 0;

    /// Sub-millisecond offset added to `time_low`, in 100 ns units, below 10000.
    std::uint32_t tick = 0;

    /// 48-bit node identifier with the multicast bit set.
    std::uint64_t node = 0;
};

/**
 * @class V1Generator
 * @brief Owns a `V1State` and advances it once per generated identifier.
 *
 * @details
 * Every generation is one critical section: the decision between advancing the tick
 * and bumping the sequence reads `timestamp`, `tick` and `sequence` together, so the
 * whole read-modify-write runs under a single mutex. One instance may be shared by
 * any number of threads.
 *
 * The clock and random source are borrowed and must outlive the generator.
 */
class V1Generator {
  public:
    /// Multicast bit of the 48-bit node, marking a randomly generated node id.
    static constexpr std::uint64_t kMulticastBit = 0x010000000000ULL;

    /// A `tick_ceiling` above `Config::kMaxTickCeiling` is clamped to it.
    V1Generator(const infra::Clock& clock, infra::RandomSource& random,
                const infra::Config& config = infra::Config());

    V1Generator(const V1Generator&) = delete;
    V1Generator& operator=(const V1Generator&) = delete;

    /**
     * @brief Generates the next version 1 identifier.
     *
     * State Transition:
     * 1. A new millisecond adopts the clock value and re-randomizes the tick; a clock
     *    that moved backwards also bumps the sequence.
     * 2. A repeated millisecond advances the tick by 1-16 with probability `tick_ratio`
     *    while the tick is below `tick_ceiling`, otherwise bumps the sequence.
     *
     * @throws std::out_of_range if the clock reports a time before 1582-10-15. The
     * state is left untouched in that case.
     */
    Identifier generate();

    /**
     * @brief Draws a fresh sequence and node and zeroes the timestamp and tick.
     *
     * Intended for tests and for recovering after the node identity is known to have
     * changed. Never called implicitly.
     */
    void reset();

    /// Copy of the current state, taken under the lock.
    V1State snapshot() const;

  private:
    /// Draws the initial state. Caller holds `mutex_` (or is the constructor).
    void init_state();

    const infra::Clock& clock_;
    infra::RandomSource& random_;
    double tick_ratio_;
    std::uint32_t tick_ceiling_;

    mutable std::mutex mutex_;
    V1State state_;
};

} // namespace uuidforge::core
