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
 * @file identifier.cpp
 * @brief Field storage and derived encodings of an identifier.
 */

#include "uuidforge/core/identifier.hpp"

#include "uuidforge/core/field_codec.hpp"

#include <cJSON.h>
#include <cstdlib>

namespace uuidforge::core {

namespace {

std::uint64_t width_mask(unsigned bits)
{
    return bits >= 64 ? ~0ULL : ((1ULL << bits) - 1);
}

} // namespace

Identifier::Identifier() : Identifier(0, 0, 0, 0, 0, 0) {}

/**
 * @brief Stores the fields and precomputes every representation.
 *
 * Construction Sequence:
 * 1. **Masking**: Each value is clipped to its declared width.
 * 2. **Per-field Encoding**: Binary and hex strings of exact width.
 * 3. **Aggregation**: Concatenates the per-field strings into the 128-bit forms.
 */
Identifier::Identifier(std::uint64_t time_low, std::uint64_t time_mid,
                       std::uint64_t time_hi_and_version, std::uint64_t clock_seq_hi_and_reserved,
                       std::uint64_t clock_seq_low, std::uint64_t node)
    : fields_{time_low, time_mid, time_hi_and_version, clock_seq_hi_and_reserved, clock_seq_low,
              node}
{
    for (std::size_t i = 0; i < kFieldCount; ++i) {
        fields_[i] &= width_mask(kFieldBits[i]);
        bit_fields_[i] = FieldCodec::bin(fields_[i], kFieldBits[i]);
        hex_fields_[i] = FieldCodec::hex(fields_[i], kFieldBits[i] / 4);
    }

    version_ = static_cast<unsigned>((fields_[2] >> 12) & 0xF);

    for (std::size_t i = 0; i < kFieldCount; ++i) {
        bit_string_ += bit_fields_[i];
        hex_no_delim_ += hex_fields_[i];
    }

    hex_string_ = hex_fields_[0] + "-" + hex_fields_[1] + "-" + hex_fields_[2] + "-" +
                  hex_fields_[3] + hex_fields_[4] + "-" + hex_fields_[5];
    urn_ = "urn:uuid:" + hex_string_;
}

Identifier Identifier::create_checked(std::uint64_t time_low, std::uint64_t time_mid,
                                      std::uint64_t time_hi_and_version,
                                      std::uint64_t clock_seq_hi_and_reserved,
                                      std::uint64_t clock_seq_low, std::uint64_t node)
{
    const std::array<std::uint64_t, kFieldCount> values = {
        time_low, time_mid, time_hi_and_version, clock_seq_hi_and_reserved, clock_seq_low, node};

    for (std::size_t i = 0; i < kFieldCount; ++i) {
        if (values[i] & ~width_mask(kFieldBits[i])) {
            throw FieldOverflow("Identifier: " + std::string(kFieldNames[i]) + " value " +
                                std::to_string(values[i]) + " exceeds " +
                                std::to_string(kFieldBits[i]) + " bits");
        }
    }
    return Identifier(time_low, time_mid, time_hi_and_version, clock_seq_hi_and_reserved,
                      clock_seq_low, node);
}

std::uint64_t Identifier::field(std::size_t index) const
{
    if (index >= kFieldCount) {
        throw std::out_of_range("Identifier: field index " + std::to_string(index));
    }
    return fields_[index];
}

std::uint64_t Identifier::field(std::string_view name) const
{
    for (std::size_t i = 0; i < kFieldCount; ++i) {
        if (kFieldNames[i] == name) {
            return fields_[i];
        }
    }
    throw std::out_of_range("Identifier: unknown field '" + std::string(name) + "'");
}

const std::string& Identifier::bit_field(std::size_t index) const
{
    if (index >= kFieldCount) {
        throw std::out_of_range("Identifier: field index " + std::to_string(index));
    }
    return bit_fields_[index];
}

const std::string& Identifier::hex_field(std::size_t index) const
{
    if (index >= kFieldCount) {
        throw std::out_of_range("Identifier: field index " + std::to_string(index));
    }
    return hex_fields_[index];
}

/**
 * @brief Renders the identifier through cJSON.
 *
 * Field values go through `double`; every field is at most 48 bits wide, so the
 * conversion is exact.
 */
std::string Identifier::to_json() const
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "hex", hex_string_.c_str());
    cJSON_AddStringToObject(root, "urn", urn_.c_str());
    cJSON_AddNumberToObject(root, "version", version_);

    cJSON* fields = cJSON_CreateObject();
    for (std::size_t i = 0; i < kFieldCount; ++i) {
        cJSON_AddNumberToObject(fields, std::string(kFieldNames[i]).c_str(),
                                static_cast<double>(fields_[i]));
    }
    // Ownership Transfer: 'fields' becomes child of 'root'
    cJSON_AddItemToObject(root, "fields", fields);

    char* raw = cJSON_PrintUnformatted(root);
    std::string out = raw ? std::string(raw) : std::string("{}");

    free(raw);
    cJSON_Delete(root);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Identifier& id)
{
    return os << id.hex_string();
}

} // namespace uuidforge::core
