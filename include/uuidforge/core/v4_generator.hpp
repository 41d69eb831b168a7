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
 * @file v4_generator.hpp
 * @brief Random (version 4) identifier generation.
 */

#pragma once

#include "uuidforge/core/identifier.hpp"
#include "uuidforge/infra/random_source.hpp"

#include <string>

namespace uuidforge::core {

/**
 * @class V4Generator
 * @brief Stateless assembly of random identifiers.
 *
 * @details
 * Every field is drawn from the random source at its declared width, except the
 * fixed bits:
 * - `timeHiAndVersion` top nibble is `0100` (version 4), 12 random bits below.
 * - `clockSeqHiAndReserved` top two bits are `10` (RFC 4122 variant), 6 random bits below.
 *
 * The random source is borrowed and must outlive the generator.
 */
class V4Generator {
  public:
    explicit V4Generator(infra::RandomSource& random) : random_(random) {}

    Identifier generate();

    /**
     * @brief Shorthand for `generate().hex_string()`.
     *
     * The output adheres to `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`, where `y` is one
     * of `{8, 9, a, b}`.
     */
    std::string generate_string();

  private:
    infra::RandomSource& random_;
};

} // namespace uuidforge::core
