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
 * @brief `kid` command-line tool: generate or inspect identifiers.
 *
 * @details
 * Startup sequence:
 * 1. Argument Parsing (`-c N`, `-v`, IDs to inspect, `-` for stdin).
 * 2. Generator Initialization (one `IdGenerator` for the whole run).
 * 3. Generation or Inspection.
 */

#include "kid/core/error.hpp"
#include "kid/core/id.hpp"
#include "kid/infra/id_generator.hpp"
#include "kid/infra/logger.hpp"
#include "kid/infra/string.hpp"

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [-c N] [-v] [ID ...]\n"
              << "Options:\n"
              << "  " << binary_name << " 06bpk9h5kd17xd7z   Decode and inspect the supplied ID(s)\n"
              << "  " << binary_name << " -                  Inspect IDs read from stdin, one per line\n"
              << "  -c N               Generate N IDs (Default: 1)\n"
              << "  -v                 Enable debug logging\n"
              << "  --help             Show this help message\n\n"
              << "With no parameters, " << binary_name << " generates 1 ID encoded as Base32.\n"
              << "Generate and inspect 4 IDs using command substitution:\n"
              << "  " << binary_name << " `" << binary_name << " -c 4`\n";
}

/**
 * @brief Prints the components of one encoded identifier, or why it is invalid.
 *
 * @return false if `text` did not decode.
 */
bool inspect(const std::string& text)
{
    try {
        kid::Id id = kid::Id::from_string(text);
        std::cout << text << " ts:" << id.timestamp() << " seq:" << std::setw(4) << id.sequence()
                  << " rnd:" << std::setw(5) << id.random() << " " << id.time_string() << " ID{"
                  << kid::infra::String::hex_list(id.bytes().data(), id.bytes().size()) << " }\n";
        return true;
    } catch (const kid::InvalidIdError& e) {
        std::cout << "[" << text << "] " << e.what() << "\n";
        return false;
    }
}

/**
 * @brief Main Execution Entry Point.
 *
 * @return 0 on success, 1 on a usage error or if any inspected ID was invalid.
 */
int main(int argc, char* argv[])
{
    // 1. Configuration Defaults
    long count = 1;
    bool count_given = false;
    bool from_stdin = false;
    std::vector<std::string> ids;

    try {
        // 2. Parse Command Line Arguments
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                print_help(argv[0]);
                return 0;
            } else if (arg == "-v") {
                kid::infra::Logger::set_level(kid::infra::LogLevel::DEBUG);
            } else if (arg == "-c") {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("-c requires a count");
                }
                count = std::stol(argv[++i]);
                if (count < 1) {
                    throw std::invalid_argument("-c count must be positive");
                }
                count_given = true;
            } else if (arg == "-") {
                from_stdin = true;
            } else {
                ids.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "kid: Error, invalid arguments (" << e.what() << ").\n";
        print_help(argv[0]);
        return 1;
    }

    if (count_given && (!ids.empty() || from_stdin)) {
        std::cerr << "kid: Error, cannot generate ID(s) and inspect at the same time.\n";
        print_help(argv[0]);
        return 1;
    }

    try {
        if (!ids.empty() || from_stdin) {
            bool all_valid = true;
            for (const auto& text : ids) {
                all_valid = inspect(text) && all_valid;
            }
            if (from_stdin) {
                std::string line;
                while (std::getline(std::cin, line)) {
                    line = kid::infra::String::trim(line);
                    if (!line.empty()) {
                        all_valid = inspect(line) && all_valid;
                    }
                }
            }
            return all_valid ? 0 : 1;
        }

        // 3. Generation
        kid::infra::IdGenerator generator;
        kid::infra::Logger::log(kid::infra::LogLevel::DEBUG,
                                "kid: generating " + std::to_string(count) + " ID(s)");
        for (long c = 0; c < count; ++c) {
            std::cout << generator.generate() << '\n';
        }
    } catch (const std::exception& e) {
        kid::infra::Logger::log(kid::infra::LogLevel::FATAL,
                                "kid: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
