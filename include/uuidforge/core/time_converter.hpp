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
 * @file time_converter.hpp
 * @brief Conversion from Unix milliseconds to RFC 4122 time fields.
 *
 * @details
 * RFC 4122 timestamps count 100-nanosecond intervals since 1582-10-15T00:00:00Z,
 * the date of the Gregorian calendar reform. The 60-bit count is split across the
 * `time_low` (32 bits), `time_mid` (16 bits) and `time_hi` (12 bits) fields.
 */

#pragma once

#include <cstdint>

namespace uuidforge::core {

/// The three time fields of a version 1 identifier, before the version nibble is applied.
struct TimeFields {
    std::uint32_t low = 0;
    std::uint16_t mid = 0;
    std::uint16_t hi = 0;
};

class TimeConverter {
  public:
    /// 1582-10-15T00:00:00Z expressed in milliseconds relative to the Unix epoch.
    static constexpr std::int64_t kGregorianEpochMs = -12219292800000LL;

    /// 100-nanosecond intervals per millisecond.
    static constexpr std::uint64_t kIntervalsPerMs = 10000;

    /**
     * @brief Splits a calendar time into RFC 4122 time fields.
     *
     * With `delta = now_ms - kGregorianEpochMs`:
     * - `low  = ((delta & 0xFFFFFFF) * 10000) mod 2^32`
     * - `high = (delta * 10000 / 2^32) & 0xFFFFFFF`, `mid = high & 0xFFFF`, `hi = high >> 16`
     *
     * @throws std::out_of_range if `now_ms` precedes the Gregorian epoch.
     */
    static TimeFields convert(std::int64_t now_ms);
};

} // namespace uuidforge::core
