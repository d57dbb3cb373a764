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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel used
 * by the command-line tool and by the few library paths that report anything
 * (the fail-fast constructor and the JSON hook). The codec itself never logs.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace fuid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-symbol or per-call detail.
    DEBUG, ///< Rejected inputs and other diagnostic detail.
    INFO,  ///< Nominal events (tool start-up, summary lines).
    WARN,  ///< Suspicious but accepted input.
    ERROR, ///< An operation failed; the process continues.
    FATAL  ///< Unrecoverable misuse; the process is about to terminate.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Output is serialized by an internal mutex so records from concurrent
 * threads never interleave. Records below the configured minimum level are
 * dropped before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * fuid::infra::Logger::log(LogLevel::ERROR, "decode: invalid base62 symbol '!' at position 3");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum level that is written. Default: `INFO`.
    static void set_level(LogLevel level) noexcept;

    static LogLevel level() noexcept;

    /// @brief True if a record at `level` would currently be written.
    static bool enabled(LogLevel level) noexcept;

    /**
     * @brief Maps a level name to its value.
     *
     * Accepts `trace`, `debug`, `info`, `warn`, `error`, `fatal` in any case.
     */
    static std::optional<LogLevel> parse_level(std::string_view name);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved records.
    static std::mutex mutex_;

    static std::atomic<LogLevel> level_;
};

} // namespace fuid::infra
