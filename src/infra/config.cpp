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
 * @file config.cpp
 * @brief JSON configuration loading via cJSON.
 */

#include "uuidforge/infra/config.hpp"

#include <cJSON.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace uuidforge::infra {

namespace {

/// Owns a parsed cJSON tree for the duration of a load.
class ScopedJson {
  public:
    explicit ScopedJson(cJSON* root) : root_(root) {}

    ScopedJson(const ScopedJson&) = delete;
    ScopedJson& operator=(const ScopedJson&) = delete;

    ~ScopedJson()
    {
        if (root_) {
            cJSON_Delete(root_);
        }
    }

    cJSON* get() const
    {
        return root_;
    }

  private:
    cJSON* root_;
};

} // namespace

Config Config::from_json(const std::string& json)
{
    ScopedJson doc(cJSON_Parse(json.c_str()));
    if (!doc.get()) {
        throw std::runtime_error("Config: invalid JSON syntax");
    }
    if (!cJSON_IsObject(doc.get())) {
        throw std::runtime_error("Config: top-level value must be an object");
    }

    Config cfg;

    cJSON* ratio = cJSON_GetObjectItem(doc.get(), "tick_ratio");
    if (ratio) {
        if (!cJSON_IsNumber(ratio)) {
            throw std::runtime_error("Config: 'tick_ratio' must be a number");
        }
        if (ratio->valuedouble < 0.0 || ratio->valuedouble > 1.0) {
            throw std::runtime_error("Config: 'tick_ratio' must lie in [0, 1]");
        }
        cfg.tick_ratio = ratio->valuedouble;
    }

    cJSON* ceiling = cJSON_GetObjectItem(doc.get(), "tick_ceiling");
    if (ceiling) {
        if (!cJSON_IsNumber(ceiling)) {
            throw std::runtime_error("Config: 'tick_ceiling' must be a number");
        }
        if (ceiling->valuedouble < 0 || ceiling->valuedouble > kMaxTickCeiling) {
            throw std::runtime_error("Config: 'tick_ceiling' must lie in [0, " +
                                     std::to_string(kMaxTickCeiling) + "]");
        }
        cfg.tick_ceiling = static_cast<std::uint32_t>(ceiling->valuedouble);
    }

    cJSON* level = cJSON_GetObjectItem(doc.get(), "log_level");
    if (level) {
        if (!cJSON_IsString(level) || !level->valuestring) {
            throw std::runtime_error("Config: 'log_level' must be a string");
        }
        auto parsed = Logger::parse_level(level->valuestring);
        if (!parsed) {
            throw std::runtime_error("Config: unknown log level '" +
                                     std::string(level->valuestring) + "'");
        }
        cfg.log_level = *parsed;
    }

    return cfg;
}

Config Config::load_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Config: cannot open '" + path + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    Logger::log(LogLevel::DEBUG, "Config: Loaded " + path);
    return from_json(buffer.str());
}

} // namespace uuidforge::infra
