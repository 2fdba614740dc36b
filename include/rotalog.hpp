/**
 * @file rotalog.hpp
 * @brief Pattern driven logging to the console or to rotating files
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This logging library provides:
 * - Output layout described by a pattern compiled once ("%time %level %message")
 * - Console receiver with per-level ANSI colours
 * - File receiver with daily, size or line-count rotation
 * - Per-receiver line and byte counters
 * - Pooled log entries, so steady-state logging does not allocate entries
 * - A logger built from a short configuration string
 *
 * Basic Usage:
 * @code
 * auto log = rotalog::make_logger(R"(
 *     receiver = "FILE"
 *     level = "INFO"
 *     file = "/var/log/app/app.log"
 *     rotate {
 *         mode = "size"
 *         size = 64
 *     }
 * )");
 *
 * log->info("Server started on port ", 8080);
 * log->warnf("{} of {} workers busy", busy, total);
 * log->debug("dropped, DEBUG is more verbose than INFO");
 *
 * auto s = log->get_stats();   // s.lines_written, s.bytes_written
 * @endcode
 *
 * Pattern Flags:
 * @code
 * %level:-5        INFO       left aligned, padded to 5
 * %time:15:04:05   19:22:11   local time, reference-time layout
 * %utctime         ...        same in UTC
 * %longfile        /src/app/server.cpp
 * %shortfile       server.cpp
 * %line            L42
 * %message         the rendered message
 * %custom:text     literal text
 * @endcode
 *
 * The standard logger needs no setup (stderr, DEBUG, default pattern):
 * @code
 * rotalog::info("cache warmed in ", ms, " ms");
 * rotalog::errorf("lost connection to {}", host);
 * @endcode
 *
 * Building blocks can also be used directly:
 * @code
 * auto pattern = rotalog::make_pattern("%level %message");
 * auto recv    = rotalog::make_file_receiver(pattern, "app.log",
 *                                            {.mode = rotalog::rotate_policy::kind::lines, .max_lines = 1000});
 * rotalog::logger log(rotalog::log_level::trace, pattern, std::move(recv));
 * @endcode
 *
 * Construction errors are thrown as rotalog::config_error; logging calls
 * return a std::error_code instead of throwing.
 */
#pragma once

#include "log_version.hpp"
#include "log_types.hpp"
#include "log_errors.hpp"
#include "log_time_layout.hpp"
#include "log_pattern.hpp"
#include "log_entry.hpp"
#include "log_entry_pool.hpp"
#include "log_stats.hpp"
#include "log_formatters.hpp"
#include "log_writers.hpp"
#include "log_file_rotator.hpp"
#include "log_receiver.hpp"
#include "log_receivers.hpp"
#include "log_config.hpp"
#include "log_logger.hpp"
