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
 * @brief Command-line front end for generating and converting identifiers.
 *
 * @details
 * Startup sequence:
 * 1. Option parsing (`--count`, `--log-level`, `--help`).
 * 2. Logger configuration.
 * 3. Command dispatch; results go to stdout, failures to the logger.
 */

#include "fuid/core/fuid.hpp"
#include "fuid/infra/logger.hpp"
#include "fuid/infra/string.hpp"

#ifdef FUID_WITH_CJSON
#include "fuid/serial/json.hpp"
#endif

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using fuid::infra::Logger;
using fuid::infra::LogLevel;

namespace {

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [COMMAND] [ARGS] [OPTIONS]\n"
              << "Commands:\n"
              << "  new                 Print random identifiers (default command)\n"
              << "  encode <decimal>    Encode a 128-bit decimal integer\n"
              << "  decode <id>         Print the decimal value of an identifier\n"
              << "  from-uuid <uuid>    Convert a canonical UUID to an identifier\n"
              << "  to-uuid <id>        Convert an identifier to a canonical UUID\n"
#ifdef FUID_WITH_CJSON
              << "  json <id>           Print the JSON serialization of an identifier\n"
#endif
              << "  check -             Validate identifiers read from stdin, one per line\n"
              << "Options:\n"
              << "  --count N           Number of identifiers for 'new' (Default: 1)\n"
              << "  --log-level LEVEL   trace|debug|info|warn|error|fatal (Default: info)\n"
              << "  --help              Show this help message\n";
}

/// @brief Parsed command line.
struct Options {
    std::string command = "new";
    std::vector<std::string> args;
    std::size_t count = 1;
};

/// @brief Throws std::invalid_argument on malformed options.
Options parse_options(int argc, char* argv[])
{
    Options options;
    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--count" || arg == "--log-level") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            std::string value = argv[++i];
            if (arg == "--count") {
                fuid::uint128 n = 0;
                if (!fuid::Decimal::parse(value, n) || n == 0 || n > 1000000) {
                    throw std::invalid_argument("--count expects an integer in [1, 1000000]");
                }
                options.count = static_cast<std::size_t>(n);
            } else {
                std::optional<LogLevel> level = Logger::parse_level(value);
                if (!level) {
                    throw std::invalid_argument("unknown log level '" + value + "'");
                }
                Logger::set_level(*level);
            }
        } else if (!have_command) {
            options.command = arg;
            have_command = true;
        } else {
            options.args.push_back(arg);
        }
    }
    return options;
}

/// @brief The single positional argument of a command.
const std::string& single_arg(const Options& options)
{
    if (options.args.size() != 1) {
        throw std::invalid_argument("'" + options.command + "' expects exactly one argument");
    }
    return options.args.front();
}

/// @brief Validates stdin line by line; returns the number of rejected lines.
std::size_t check_stream(std::istream& in)
{
    std::size_t line_no = 0;
    std::size_t rejected = 0;
    std::string line;

    while (std::getline(in, line)) {
        ++line_no;
        if (fuid::infra::String::is_blank(line)) {
            continue;
        }

        std::string token = fuid::infra::String::trim(line);
        fuid::DecodeFailure failure;
        if (fuid::Fuid::try_parse(token, &failure)) {
            std::cout << token << ": ok\n";
        } else {
            std::cout << token << ": " << failure.describe() << "\n";
            Logger::log(LogLevel::DEBUG, "check: line " + std::to_string(line_no) + " rejected");
            ++rejected;
        }
    }
    return rejected;
}

/// @brief Runs one command; returns the process exit status.
int run(const Options& options)
{
    const std::string& cmd = options.command;

    if (cmd == "new") {
        if (!options.args.empty()) {
            throw std::invalid_argument("'new' takes no arguments; use --count N");
        }
        for (std::size_t i = 0; i < options.count; ++i) {
            std::cout << fuid::Fuid::random() << "\n";
        }
        return 0;
    }

    if (cmd == "encode") {
        const std::string& text = single_arg(options);
        fuid::uint128 value = 0;
        if (!fuid::Decimal::parse(text, value)) {
            Logger::log(LogLevel::ERROR, "encode: '" + text + "' is not a 128-bit decimal integer");
            return 1;
        }
        std::cout << fuid::Fuid::from_int(value) << "\n";
        return 0;
    }

    if (cmd == "decode") {
        fuid::Fuid id = fuid::Fuid::from_string(single_arg(options));
        std::cout << fuid::Decimal::to_string(id.to_int()) << "\n";
        return 0;
    }

    if (cmd == "from-uuid") {
        fuid::Uuid uuid = fuid::Uuid::parse(single_arg(options));
        std::cout << fuid::Fuid::from_uuid(uuid) << "\n";
        return 0;
    }

    if (cmd == "to-uuid") {
        fuid::Fuid id = fuid::Fuid::from_string(single_arg(options));
        std::cout << id.to_uuid() << "\n";
        return 0;
    }

#ifdef FUID_WITH_CJSON
    if (cmd == "json") {
        fuid::Fuid id = fuid::Fuid::from_string(single_arg(options));
        std::cout << fuid::serial::serialize(id) << "\n";
        return 0;
    }
#endif

    if (cmd == "check") {
        if (single_arg(options) != "-") {
            throw std::invalid_argument("'check' only reads from stdin ('-')");
        }
        std::size_t rejected = check_stream(std::cin);
        if (rejected > 0) {
            Logger::log(LogLevel::ERROR,
                        "check: " + std::to_string(rejected) + " invalid identifier(s)");
            return 1;
        }
        return 0;
    }

    throw std::invalid_argument("unknown command '" + cmd + "'");
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--help") {
            print_help(argv[0]);
            return 0;
        }
    }

    try {
        Options options = parse_options(argc, argv);
        Logger::log(LogLevel::TRACE, "cli: running '" + options.command + "'");
        return run(options);

    } catch (const fuid::DecodeError& e) {
        Logger::log(LogLevel::ERROR, std::string("decode: ") + e.what());
    } catch (const std::invalid_argument& e) {
        Logger::log(LogLevel::ERROR, std::string("usage: ") + e.what());
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, std::string("cli: ") + e.what());
    }
    return 1;
}
