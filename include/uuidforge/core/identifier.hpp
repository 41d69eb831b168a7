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
 * @file identifier.hpp
 * @brief The structured RFC 4122 identifier value.
 *
 * @details
 * An `Identifier` holds the six canonical UUID fields together with every string
 * encoding derived from them. All representations are computed once at construction;
 * the object is immutable afterwards and cheap to copy around by value.
 *
 * Field layout (RFC 4122 section 4.1.2):
 *
 * | Index | Name                  | Bits |
 * |-------|-----------------------|------|
 * | 0     | timeLow               | 32   |
 * | 1     | timeMid               | 16   |
 * | 2     | timeHiAndVersion      | 16   |
 * | 3     | clockSeqHiAndReserved | 8    |
 * | 4     | clockSeqLow           | 8    |
 * | 5     | node                  | 48   |
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace uuidforge::core {

/**
 * @class FieldOverflow
 * @brief Raised by `Identifier::create_checked` when a field value exceeds its width.
 */
class FieldOverflow : public std::out_of_range {
  public:
    using std::out_of_range::out_of_range;
};

/// Field positions, usable as indices into the per-field accessors.
enum class Field : std::size_t {
    TimeLow = 0,
    TimeMid = 1,
    TimeHiAndVersion = 2,
    ClockSeqHiAndReserved = 3,
    ClockSeqLow = 4,
    Node = 5
};

class Identifier {
  public:
    static constexpr std::size_t kFieldCount = 6;

    /// Canonical camelCase field names, in field order.
    static constexpr std::array<std::string_view, kFieldCount> kFieldNames = {
        "timeLow", "timeMid", "timeHiAndVersion", "clockSeqHiAndReserved", "clockSeqLow", "node"};

    /// Declared bit width of each field, in field order.
    static constexpr std::array<unsigned, kFieldCount> kFieldBits = {32, 16, 16, 8, 8, 48};

    /// Builds the nil identifier (all fields zero).
    Identifier();

    /**
     * @brief Builds an identifier from its six fields.
     *
     * Each value is masked to its declared width; bits above the width are discarded.
     * Use `create_checked` to reject such values instead.
     */
    Identifier(std::uint64_t time_low, std::uint64_t time_mid, std::uint64_t time_hi_and_version,
               std::uint64_t clock_seq_hi_and_reserved, std::uint64_t clock_seq_low,
               std::uint64_t node);

    /**
     * @brief Builds an identifier, refusing values wider than their field.
     * @throws FieldOverflow naming the first offending field.
     */
    static Identifier create_checked(std::uint64_t time_low, std::uint64_t time_mid,
                                     std::uint64_t time_hi_and_version,
                                     std::uint64_t clock_seq_hi_and_reserved,
                                     std::uint64_t clock_seq_low, std::uint64_t node);

    /// @throws std::out_of_range if `index >= 6`.
    std::uint64_t field(std::size_t index) const;
    std::uint64_t field(Field f) const
    {
        return fields_[static_cast<std::size_t>(f)];
    }
    /// @throws std::out_of_range for a name not in `kFieldNames`.
    std::uint64_t field(std::string_view name) const;

    /// Binary rendering of one field, exactly as wide as the field.
    const std::string& bit_field(std::size_t index) const;
    /// Hex rendering of one field, a quarter as wide as the field.
    const std::string& hex_field(std::size_t index) const;

    std::uint64_t time_low() const
    {
        return fields_[0];
    }
    std::uint64_t time_mid() const
    {
        return fields_[1];
    }
    std::uint64_t time_hi_and_version() const
    {
        return fields_[2];
    }
    std::uint64_t clock_seq_hi_and_reserved() const
    {
        return fields_[3];
    }
    std::uint64_t clock_seq_low() const
    {
        return fields_[4];
    }
    std::uint64_t node() const
    {
        return fields_[5];
    }

    /// Bits 12-15 of `timeHiAndVersion`.
    unsigned version() const
    {
        return version_;
    }

    /// 128-character binary string.
    const std::string& bit_string() const
    {
        return bit_string_;
    }

    /// 32 hex digits, no separators.
    const std::string& hex_no_delim() const
    {
        return hex_no_delim_;
    }

    /// Canonical `xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx`, lowercase.
    const std::string& hex_string() const
    {
        return hex_string_;
    }

    /// `urn:uuid:` followed by `hex_string()`.
    const std::string& urn() const
    {
        return urn_;
    }

    std::string to_string() const
    {
        return hex_string_;
    }

    /**
     * @brief Serializes the identifier as a compact JSON object.
     *
     * @code
     * {"hex":"...","urn":"urn:uuid:...","version":1,
     *  "fields":{"timeLow":...,"timeMid":...,...,"node":...}}
     * @endcode
     */
    std::string to_json() const;

    /// Field-wise equality; string forms are never compared.
    bool operator==(const Identifier& other) const
    {
        return fields_ == other.fields_;
    }
    bool operator!=(const Identifier& other) const
    {
        return !(*this == other);
    }

  private:
    std::array<std::uint64_t, kFieldCount> fields_;
    std::array<std::string, kFieldCount> bit_fields_;
    std::array<std::string, kFieldCount> hex_fields_;

    unsigned version_;
    std::string bit_string_;
    std::string hex_no_delim_;
    std::string hex_string_;
    std::string urn_;
};

std::ostream& operator<<(std::ostream& os, const Identifier& id);

} // namespace uuidforge::core
