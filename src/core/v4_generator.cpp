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
 * @file v4_generator.cpp
 * @brief Implementation of random identifier assembly.
 */

#include "uuidforge/core/v4_generator.hpp"

namespace uuidforge::core {

/**
 * @brief Generates an RFC 4122 compliant version 4 identifier.
 *
 * Draws happen in field order so a scripted source maps one-to-one onto fields.
 */
Identifier V4Generator::generate()
{
    std::uint64_t time_low = random_.next_bits(32);
    std::uint64_t time_mid = random_.next_bits(16);

    // Force high nibble to '0100' (Version 4: Random).
    std::uint64_t time_hi_and_version = 0x4000 | random_.next_bits(12);

    // Force high bits to '10' (Variant 1: RFC 4122).
    std::uint64_t clock_seq_hi = 0x80 | random_.next_bits(6);

    std::uint64_t clock_seq_low = random_.next_bits(8);
    std::uint64_t node = random_.next_bits(48);

    return Identifier(time_low, time_mid, time_hi_and_version, clock_seq_hi, clock_seq_low, node);
}

std::string V4Generator::generate_string()
{
    return generate().hex_string();
}

} // namespace uuidforge::core
