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

#include "uuidforge/compat/legacy_generator.hpp"

namespace uuidforge::compat {

std::string LegacyGenerator::generate(const LegacyOptions& options)
{
    if (options.version == 1) {
        return ctx_.v1().generate().hex_string();
    }
    return ctx_.v4().generate_string();
}

} // namespace uuidforge::compat
