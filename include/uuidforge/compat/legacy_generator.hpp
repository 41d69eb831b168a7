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
 * @file legacy_generator.hpp
 * @brief Adapter for callers of the older single-function generation API.
 *
 * @details
 * Older callers request identifiers through one string-returning function and
 * select the version with an option. This adapter keeps that convention on top
 * of a `Context` without changing the generators themselves.
 */

#pragma once

#include "uuidforge/uuid.hpp"

#include <string>

namespace uuidforge::compat {

struct LegacyOptions {
    /// 1 selects time-based generation; any other value selects version 4.
    int version = 4;
};

class LegacyGenerator {
  public:
    explicit LegacyGenerator(Context& ctx) : ctx_(ctx) {}

    /// `hex_string` of a new identifier of the requested version.
    std::string generate(const LegacyOptions& options = LegacyOptions());

  private:
    Context& ctx_;
};

} // namespace uuidforge::compat
