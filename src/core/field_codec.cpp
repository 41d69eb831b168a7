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
 * @file field_codec.cpp
 * @brief Implementation of the radix aligners.
 */

#include "uuidforge/core/field_codec.hpp"

#include <algorithm>
#include <stdexcept>

namespace uuidforge::core {

namespace {
constexpr char kDigits[] = "0123456789abcdef";
}

/**
 * @brief Formats and pads a field value.
 *
 * Implementation Strategy:
 * 1. **Digit Extraction**: Emits digits least-significant first, then reverses.
 * 2. **Padding**: Walks the bits of the missing width, doubling a chunk of zeros at
 * each step and prepending it whenever the current bit is set. A 32-character binary
 * field needs at most six prepends.
 */
std::string FieldCodec::align(std::uint64_t value, int radix, std::size_t length)
{
    if (radix != 2 && radix != 16) {
        throw std::invalid_argument("FieldCodec: unsupported radix " + std::to_string(radix));
    }

    std::string digits;
    do {
        digits.push_back(kDigits[value % static_cast<unsigned>(radix)]);
        value /= static_cast<unsigned>(radix);
    } while (value != 0);
    std::reverse(digits.begin(), digits.end());

    if (digits.size() >= length) {
        return digits;
    }

    std::string chunk = "0";
    for (std::size_t missing = length - digits.size(); missing > 0;
         missing >>= 1, chunk += chunk) {
        if (missing & 1) {
            digits.insert(0, chunk);
        }
    }
    return digits;
}

} // namespace uuidforge::core
