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
 * @file field_codec.hpp
 * @brief Fixed-width, zero-padded rendering of UUID field values.
 */

#pragma once

#include <cstdint>
#include <string>

namespace uuidforge::core {

/**
 * @class FieldCodec
 * @brief Renders unsigned integers in base 2 or base 16.
 */
class FieldCodec {
  public:
    /**
     * @brief Formats `value` in `radix` and left-pads it with `'0'` to `length` characters.
     *
     * Hex digits are lowercase. A representation already `length` characters or longer
     * is returned as is; callers guarantee the value fits its width.
     *
     * @param value The value to render.
     * @param radix Either 2 or 16.
     * @param length Minimum output width.
     * @throws std::invalid_argument for any other radix.
     *
     * @code
     * FieldCodec::align(255, 16, 4); // "00ff"
     * FieldCodec::align(5, 2, 4);    // "0101"
     * @endcode
     */
    static std::string align(std::uint64_t value, int radix, std::size_t length);

    /// `align(value, 16, length)`.
    static std::string hex(std::uint64_t value, std::size_t length)
    {
        return align(value, 16, length);
    }

    /// `align(value, 2, length)`.
    static std::string bin(std::uint64_t value, std::size_t length)
    {
        return align(value, 2, length);
    }
};

} // namespace uuidforge::core
