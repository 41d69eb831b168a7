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
 * @file main.cpp
 * @brief Command line front end.
 *
 * @details
 * This file contains the `main` function which orchestrates:
 * 1. Argument Parsing.
 * 2. Configuration Loading (optional JSON file, then flag overrides).
 * 3. Generation or Validation, one identifier per output line.
 */

#include "uuidforge/infra/config.hpp"
#include "uuidforge/infra/logger.hpp"
#include "uuidforge/uuid.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using uuidforge::infra::LogLevel;
using uuidforge::infra::Logger;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitInvalidInput = 2;

struct Options {
    int version = 4;
    long count = 1;
    std::string format = "hex";
    std::string parse_text;
    bool parse = false;
    std::string config_path;
    std::string log_level;
};

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  -v, --version N     Identifier version, 1 or 4 (Default: 4)\n"
              << "  -n, --count N       Number of identifiers to emit (Default: 1)\n"
              << "  -f, --format FMT    hex | nodelim | urn | bits | json (Default: hex)\n"
              << "  -p, --parse TEXT    Validate TEXT and print it in the selected format\n"
              << "  -c, --config FILE   JSON configuration file\n"
              << "      --log-level L   trace | debug | info | warn | error | fatal\n"
              << "  -h, --help          Show this help message\n";
}

/// Returns the value following `argv[i]`, advancing `i`.
std::string take_value(int argc, char* argv[], int& i)
{
    if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value for " + std::string(argv[i]));
    }
    return argv[++i];
}

Options parse_args(int argc, char* argv[])
{
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--version") {
            opts.version = std::stoi(take_value(argc, argv, i));
            if (opts.version != 1 && opts.version != 4) {
                throw std::invalid_argument("Unsupported version " + std::to_string(opts.version));
            }
        } else if (arg == "-n" || arg == "--count") {
            opts.count = std::stol(take_value(argc, argv, i));
            if (opts.count < 0) {
                throw std::invalid_argument("Count must not be negative");
            }
        } else if (arg == "-f" || arg == "--format") {
            opts.format = take_value(argc, argv, i);
        } else if (arg == "-p" || arg == "--parse") {
            opts.parse = true;
            opts.parse_text = take_value(argc, argv, i);
        } else if (arg == "-c" || arg == "--config") {
            opts.config_path = take_value(argc, argv, i);
        } else if (arg == "--log-level") {
            opts.log_level = take_value(argc, argv, i);
        } else {
            throw std::invalid_argument("Unknown option " + arg);
        }
    }
    return opts;
}

std::string render(const uuidforge::core::Identifier& id, const std::string& format)
{
    if (format == "hex")
        return id.hex_string();
    if (format == "nodelim")
        return id.hex_no_delim();
    if (format == "urn")
        return id.urn();
    if (format == "bits")
        return id.bit_string();
    if (format == "json")
        return id.to_json();
    throw std::invalid_argument("Unknown format " + format);
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 *
 * @return 0 on success, 1 on usage or runtime errors, 2 when `--parse` input is invalid.
 */
int main(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help(argv[0]);
            return kExitOk;
        }
    }

    // Identifiers own stdout; diagnostics stay on stderr.
    Logger::route_all_to_stderr(true);
    Logger::set_level(LogLevel::WARN);

    try {
        Options opts = parse_args(argc, argv);

        uuidforge::infra::Config config;
        if (!opts.config_path.empty()) {
            config = uuidforge::infra::Config::load_file(opts.config_path);
        }
        if (!opts.log_level.empty()) {
            auto level = Logger::parse_level(opts.log_level);
            if (!level) {
                throw std::invalid_argument("Unknown log level " + opts.log_level);
            }
            config.log_level = *level;
        }
        if (config.log_level) {
            Logger::set_level(*config.log_level);
        }

        Logger::log(LogLevel::INFO, "Config: tick_ratio=" + std::to_string(config.tick_ratio) +
                                        " tick_ceiling=" + std::to_string(config.tick_ceiling));

        if (opts.parse) {
            auto parsed = uuidforge::Uuid::parse(opts.parse_text);
            if (!parsed) {
                Logger::log(LogLevel::ERROR, "Parse: '" + opts.parse_text +
                                                 "' is not a valid identifier");
                return kExitInvalidInput;
            }
            std::cout << render(*parsed, opts.format) << "\n";
            return kExitOk;
        }

        uuidforge::Context ctx(config);
        for (long i = 0; i < opts.count; ++i) {
            uuidforge::core::Identifier id =
                (opts.version == 1) ? ctx.v1().generate() : ctx.v4().generate();
            std::cout << render(id, opts.format) << "\n";
        }
        std::cout.flush();

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: " + std::string(e.what()));
        return kExitFailure;
    }

    return kExitOk;
}
