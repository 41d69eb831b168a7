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
 * @file random_source.cpp
 * @brief Implementation of the bit-width random draws.
 */

#include "uuidforge/infra/random_source.hpp"

#include <stdexcept>
#include <string>

namespace uuidforge::infra {

namespace {
constexpr int kSingleDrawBits = 30;
}

std::uint64_t RandomSource::next_bits(int width)
{
    if (width < 0 || width > kMaxBits) {
        throw std::invalid_argument("RandomSource: bit width " + std::to_string(width) +
                                    " outside [0, " + std::to_string(kMaxBits) + "]");
    }
    if (width == 0) {
        return 0;
    }
    if (width <= kSingleDrawBits) {
        return draw(width);
    }

    // Two independent draws: low 30 bits first, then the remaining high bits.
    std::uint64_t low = draw(kSingleDrawBits);
    std::uint64_t high = draw(width - kSingleDrawBits);
    return (high << kSingleDrawBits) | low;
}

double RandomSource::next_unit()
{
    return static_cast<double>(next_bits(kSingleDrawBits)) /
           static_cast<double>(1u << kSingleDrawBits);
}

/**
 * @brief Seeds the engine from the system's non-deterministic entropy device.
 */
MersenneRandomSource::MersenneRandomSource()
{
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    engine_.seed(seq);
}

MersenneRandomSource::MersenneRandomSource(std::uint64_t seed) : engine_(seed) {}

std::uint32_t MersenneRandomSource::draw(int width)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t raw = engine_();
    // Top bits of the 64-bit output carry the best-mixed state.
    return static_cast<std::uint32_t>(raw >> (64 - width));
}

} // namespace uuidforge::infra
