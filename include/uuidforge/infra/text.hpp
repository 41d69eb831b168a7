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
 * @file text.hpp
 * @brief Small text primitives shared by the parser, the config loader and the CLI.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace uuidforge::infra {

/**
 * @class Text
 * @brief A static container for stateless text processing helpers.
 */
class Text {
  public:
    /**
     * @brief Trims leading and trailing whitespace (as classified by `std::isspace`).
     *
     * @param s The source string to process.
     * @return A new string without the surrounding whitespace. Empty if the input is
     * empty or consists solely of whitespace.
     *
     * @code
     * std::string clean = Text::trim("  {01234567-89ab-4def-8123-456789abcdef}\n");
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// ASCII lower-casing. Non-letters are copied unchanged.
    static std::string to_lower(std::string_view s);

    /// True if `s` consists of exactly `count` hexadecimal digits (either case).
    static bool is_hex_run(std::string_view s, std::size_t count);

    /// Case-insensitive ASCII prefix test.
    static bool starts_with_nocase(std::string_view s, std::string_view prefix);
};

} // namespace uuidforge::infra
