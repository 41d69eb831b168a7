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
 * @file parser.hpp
 * @brief Strict reader for the textual identifier forms.
 */

#pragma once

#include "uuidforge/core/identifier.hpp"

#include <optional>
#include <string_view>

namespace uuidforge::core {

/**
 * @class Parser
 * @brief Converts hyphenated, braced or URN text back into an `Identifier`.
 *
 * @details
 * Accepted grammar (case-insensitive, surrounding whitespace ignored):
 *
 * @code
 * [ "urn:uuid:" | "{" ] 8HEX "-" 4HEX "-" 4HEX "-" 2HEX 2HEX "-" 12HEX [ "}" ]
 * @endcode
 *
 * The optional decorations must pair up: no prefix and no suffix, `{` with `}`,
 * or `urn:uuid:` with no suffix.
 */
class Parser {
  public:
    /**
     * @brief Parses `text` into an identifier.
     *
     * Never throws for malformed input, so it doubles as a validation probe.
     *
     * @return The identifier, or `std::nullopt` if the text does not match the grammar.
     *
     * @code
     * auto id = Parser::parse("{01234567-89ab-4def-8123-456789abcdef}");
     * if (id) {
     *     // id->time_low() == 0x01234567
     * }
     * @endcode
     */
    static std::optional<Identifier> parse(std::string_view text);
};

} // namespace uuidforge::core
