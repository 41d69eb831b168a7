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
 * @file uuid.cpp
 * @brief Process-wide context and facade implementation.
 */

#include "uuidforge/uuid.hpp"

#include <stdexcept>

namespace uuidforge {

Context::Context(const infra::Config& config)
    : clock_(), random_(), v1_(clock_, random_, config), v4_(random_)
{
}

Context& Uuid::context()
{
    // Function-local static: initialization is thread-safe and happens on first use.
    static Context ctx;
    return ctx;
}

std::string Uuid::generate()
{
    return context().v4().generate_string();
}

core::Identifier Uuid::generate_v1()
{
    return context().v1().generate();
}

core::Identifier Uuid::generate_v4()
{
    return context().v4().generate();
}

std::optional<core::Identifier> Uuid::parse(std::string_view text)
{
    return core::Parser::parse(text);
}

const core::Identifier& Uuid::empty()
{
    static const core::Identifier nil = [] {
        auto parsed = core::Parser::parse("00000000-0000-0000-0000-000000000000");
        if (!parsed) {
            throw std::logic_error("Uuid: nil identifier failed to parse");
        }
        return *parsed;
    }();
    return nil;
}

void Uuid::reset_state()
{
    context().v1().reset();
}

} // namespace uuidforge
