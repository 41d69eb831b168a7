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
 * @file v1_generator.cpp
 * @brief Implementation of the version 1 state machine.
 */

#include "uuidforge/core/v1_generator.hpp"

#include "uuidforge/core/time_converter.hpp"
#include "uuidforge/infra/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace uuidforge::core {

namespace {
constexpr std::uint32_t kSequenceMask = 0x3FFF;
constexpr std::uint64_t kVersion1 = 0x1000;
constexpr std::uint64_t kVariantRfc4122 = 0x80;
} // namespace

V1Generator::V1Generator(const infra::Clock& clock, infra::RandomSource& random,
                         const infra::Config& config)
    : clock_(clock), random_(random), tick_ratio_(config.tick_ratio),
      tick_ceiling_(std::min(config.tick_ceiling, infra::Config::kMaxTickCeiling))
{
    init_state();
}

void V1Generator::init_state()
{
    state_.timestamp = 0;
    state_.tick = 0;
    state_.sequence = static_cast<std::uint32_t>(random_.next_bits(14));

    // Top octet random with its lowest bit (the multicast bit) forced on.
    std::uint64_t node_hi = random_.next_bits(8) | 1;
    std::uint64_t node_lo = random_.next_bits(40);
    state_.node = node_hi * kMulticastBit + node_lo;
}

Identifier V1Generator::generate()
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::int64_t now = clock_.now_ms();
    if (now < TimeConverter::kGregorianEpochMs) {
        throw std::out_of_range("V1: Clock reading " + std::to_string(now) +
                                " ms precedes the Gregorian epoch");
    }

    if (now != state_.timestamp) {
        if (now < state_.timestamp) {
            state_.sequence++;
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "V1: Clock moved backwards by " +
                                   std::to_string(state_.timestamp - now) +
                                   " ms, clock sequence advanced.");
        }
        state_.timestamp = now;
        state_.tick = static_cast<std::uint32_t>(random_.next_bits(4));
    } else if (random_.next_unit() < tick_ratio_ && state_.tick < tick_ceiling_) {
        // Spread same-millisecond calls across the sub-millisecond range.
        state_.tick += 1 + static_cast<std::uint32_t>(random_.next_bits(4));
    } else {
        if (state_.tick >= tick_ceiling_) {
            infra::Logger::log(infra::LogLevel::TRACE,
                               "V1: Tick ceiling reached, clock sequence advanced.");
        }
        state_.sequence++;
    }

    TimeFields tf = TimeConverter::convert(state_.timestamp);

    // May carry past 32 bits; the identifier keeps the low 32.
    std::uint64_t time_low = static_cast<std::uint64_t>(tf.low) + state_.tick;
    std::uint64_t time_hi_and_version = (tf.hi & 0xFFF) | kVersion1;

    state_.sequence &= kSequenceMask;
    std::uint64_t clock_seq_hi = (state_.sequence >> 8) | kVariantRfc4122;
    std::uint64_t clock_seq_low = state_.sequence & 0xFF;

    return Identifier(time_low, tf.mid, time_hi_and_version, clock_seq_hi, clock_seq_low,
                      state_.node);
}

void V1Generator::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    init_state();
    infra::Logger::log(infra::LogLevel::DEBUG, "V1: State reset, new node and clock sequence.");
}

V1State V1Generator::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace uuidforge::core
