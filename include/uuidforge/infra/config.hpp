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
 * @file config.hpp
 * @brief Tunables for identifier generation, loadable from a JSON document.
 *
 * @details
 * A configuration file is a flat JSON object. Every key is optional:
 *
 * @code
 * {
 *   "tick_ratio": 0.25,
 *   "tick_ceiling": 9984,
 *   "log_level": "warn"
 * }
 * @endcode
 */

#pragma once

#include "uuidforge/infra/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace uuidforge::infra {

/**
 * @struct Config
 * @brief Generator and diagnostics settings.
 */
struct Config {
    /// Highest accepted `tick_ceiling`. One advance adds at most 16, so the tick stays
    /// below 10000 and never reaches the next millisecond's `time_low`.
    static constexpr std::uint32_t kMaxTickCeiling = 10000 - 16;

    /// Probability that a same-millisecond call advances the tick instead of the sequence.
    double tick_ratio = 0.25;

    /// The tick is only advanced while it is strictly below this value.
    std::uint32_t tick_ceiling = 9984;

    /// Set only when the document names a level; unset keeps the caller's threshold.
    std::optional<LogLevel> log_level;

    /**
     * @brief Builds a configuration from JSON text. Missing keys keep their defaults.
     *
     * @throws std::runtime_error on malformed JSON, a non-object document, values of the
     * wrong type, `tick_ratio` outside `[0, 1]`, `tick_ceiling` outside `[0, kMaxTickCeiling]` or an
     * unknown `log_level` name.
     */
    static Config from_json(const std::string& json);

    /**
     * @brief Reads and parses a configuration file.
     * @throws std::runtime_error if the file cannot be read or fails `from_json` validation.
     */
    static Config load_file(const std::string& path);
};

} // namespace uuidforge::infra
