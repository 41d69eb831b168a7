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
 * @file parser.cpp
 * @brief Implementation of the strict identifier grammar.
 */

#include "uuidforge/core/parser.hpp"

#include "uuidforge/infra/text.hpp"

#include <array>
#include <charconv>
#include <string>
#include <system_error>

namespace uuidforge::core {

namespace {

constexpr std::string_view kUrnPrefix = "urn:uuid:";

/// Length of `xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx`.
constexpr std::size_t kCanonicalLength = 36;

/// Offset and digit count of each hex group in the canonical body.
struct Group {
    std::size_t offset;
    std::size_t digits;
};

// The fourth hyphen-delimited group is split into its two single-byte fields.
constexpr std::array<Group, Identifier::kFieldCount> kGroups = {{
    {0, 8},
    {9, 4},
    {14, 4},
    {19, 2},
    {21, 2},
    {24, 12},
}};

constexpr std::array<std::size_t, 4> kHyphens = {8, 13, 18, 23};

enum class Prefix { None, Brace, Urn };

} // namespace

/**
 * @brief Matches and decodes an identifier.
 *
 * Matching Sequence:
 * 1. **Sanitize**: Strips surrounding whitespace.
 * 2. **Decorations**: Peels an optional `urn:uuid:` or `{` prefix and a `}` suffix and
 * rejects unpaired combinations.
 * 3. **Body**: Requires hyphens at the canonical positions and hex digits elsewhere.
 * 4. **Decode**: Converts each group with `std::from_chars` in base 16.
 */
std::optional<Identifier> Parser::parse(std::string_view text)
{
    std::string clean = infra::Text::trim(std::string(text));
    std::string_view body(clean);

    Prefix prefix = Prefix::None;
    if (infra::Text::starts_with_nocase(body, kUrnPrefix)) {
        prefix = Prefix::Urn;
        body.remove_prefix(kUrnPrefix.size());
    } else if (!body.empty() && body.front() == '{') {
        prefix = Prefix::Brace;
        body.remove_prefix(1);
    }

    bool closing_brace = false;
    if (!body.empty() && body.back() == '}') {
        closing_brace = true;
        body.remove_suffix(1);
    }

    bool paired = (prefix == Prefix::None && !closing_brace) ||
                  (prefix == Prefix::Brace && closing_brace) ||
                  (prefix == Prefix::Urn && !closing_brace);
    if (!paired || body.size() != kCanonicalLength) {
        return std::nullopt;
    }

    for (std::size_t pos : kHyphens) {
        if (body[pos] != '-') {
            return std::nullopt;
        }
    }

    std::array<std::uint64_t, Identifier::kFieldCount> values{};
    for (std::size_t i = 0; i < kGroups.size(); ++i) {
        std::string_view digits = body.substr(kGroups[i].offset, kGroups[i].digits);
        if (!infra::Text::is_hex_run(digits, kGroups[i].digits)) {
            return std::nullopt;
        }

        auto res = std::from_chars(digits.data(), digits.data() + digits.size(), values[i], 16);
        if (res.ec != std::errc{} || res.ptr != digits.data() + digits.size()) {
            return std::nullopt;
        }
    }

    return Identifier(values[0], values[1], values[2], values[3], values[4], values[5]);
}

} // namespace uuidforge::core
