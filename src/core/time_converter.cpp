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
 * @file time_converter.cpp
 * @brief Implementation of the Gregorian interval split.
 */

#include "uuidforge/core/time_converter.hpp"

#include <stdexcept>
#include <string>

namespace uuidforge::core {

TimeFields TimeConverter::convert(std::int64_t now_ms)
{
    if (now_ms < kGregorianEpochMs) {
        throw std::out_of_range("TimeConverter: " + std::to_string(now_ms) +
                                " ms precedes 1582-10-15");
    }

    auto delta = static_cast<std::uint64_t>(now_ms - kGregorianEpochMs);

    // The full interval count stays below 2^64 until roughly the year 60000.
    std::uint64_t intervals = delta * kIntervalsPerMs;
    auto high = static_cast<std::uint32_t>((intervals >> 32) & 0xFFFFFFF);

    TimeFields tf;
    tf.low = static_cast<std::uint32_t>(((delta & 0xFFFFFFF) * kIntervalsPerMs) & 0xFFFFFFFFu);
    tf.mid = static_cast<std::uint16_t>(high & 0xFFFF);
    tf.hi = static_cast<std::uint16_t>(high >> 16);
    return tf;
}

} // namespace uuidforge::core
