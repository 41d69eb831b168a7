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
 * @file uuid.hpp
 * @brief Public entry points of uuidforge.
 *
 * @details
 * A `Context` bundles one clock, one random source and the two generators wired to
 * them. Applications that need isolated or tuned generation state create their own
 * `Context`; everything else goes through the static `Uuid` facade, which owns a
 * single process-wide context created on first use.
 *
 * @code
 * std::string id = uuidforge::Uuid::generate();            // version 4 string
 * uuidforge::core::Identifier t = uuidforge::Uuid::generate_v1();
 * auto parsed = uuidforge::Uuid::parse(t.urn());            // == t
 * @endcode
 */

#pragma once

#include "uuidforge/core/identifier.hpp"
#include "uuidforge/core/parser.hpp"
#include "uuidforge/core/v1_generator.hpp"
#include "uuidforge/core/v4_generator.hpp"
#include "uuidforge/infra/clock.hpp"
#include "uuidforge/infra/config.hpp"
#include "uuidforge/infra/random_source.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace uuidforge {

/**
 * @class Context
 * @brief Generation state plus its collaborators, owned together.
 */
class Context {
  public:
    /// System clock and a `std::random_device` seeded Mersenne Twister.
    explicit Context(const infra::Config& config = infra::Config());

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    core::V1Generator& v1()
    {
        return v1_;
    }

    core::V4Generator& v4()
    {
        return v4_;
    }

  private:
    // Declaration order matters: the generators borrow these two.
    infra::SystemClock clock_;
    infra::MersenneRandomSource random_;

    core::V1Generator v1_;
    core::V4Generator v4_;
};

/**
 * @class Uuid
 * @brief Static facade over the process-wide `Context`.
 */
class Uuid {
  public:
    /// A version 4 identifier in `hex_string` form.
    static std::string generate();

    static core::Identifier generate_v1();

    static core::Identifier generate_v4();

    /// @return `std::nullopt` when `text` is not a valid identifier; never throws for bad input.
    static std::optional<core::Identifier> parse(std::string_view text);

    /// The nil identifier `00000000-0000-0000-0000-000000000000`.
    static const core::Identifier& empty();

    /// Resets the process-wide version 1 state (fresh node and clock sequence).
    static void reset_state();

    static Context& context();
};

} // namespace uuidforge
