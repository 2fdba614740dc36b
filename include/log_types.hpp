/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the logging system
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <algorithm>
#include <chrono>
#include <functional>
#include <cctype>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "robin_hood.h"

namespace rotalog
{

// Entry pool constants
inline constexpr size_t ENTRY_POOL_PREALLOCATE = 64;   // Entries created up front by the global pool
inline constexpr size_t ENTRY_POOL_MAX_FREE    = 4096; // Entries kept cached, extra releases are freed

// Receiver constants
inline constexpr size_t RECEIVER_BUFFER_RESERVE = 512; // Initial capacity of a receiver's render buffer

// File rotation constants
inline constexpr int64_t ROTATION_MAX_SIZE_MB      = 2048;      // Largest accepted rotate.size (2 GiB)
inline constexpr int64_t ROTATION_DEFAULT_SIZE_MB  = 100;       // Default rotate.size
inline constexpr int ROTATION_MAX_NAME_ATTEMPTS    = 1000;      // Collision suffixes tried for a backup name
inline constexpr unsigned LOG_FILE_MODE            = 0644;      // Permission bits of created log files

/**
 * @brief Log levels, lower value means higher severity
 *
 * A logger configured with threshold T dispatches an entry of level L only
 * when L <= T, so `error` is the least verbose threshold and `trace` the most.
 */
enum class log_level : uint8_t
{
    error = 0, ///< Error conditions
    warn  = 1, ///< Warning messages
    info  = 2, ///< General information
    debug = 3, ///< Debugging information
    trace = 4, ///< Finest-grained information
};

inline constexpr size_t LOG_LEVEL_COUNT = 5;

// Level names as they appear in rendered output
inline constexpr std::array<std::string_view, LOG_LEVEL_COUNT> log_level_names = {
    "ERROR",
    "WARN",
    "INFO",
    "DEBUG",
    "TRACE",
};

inline constexpr std::array<std::string_view, LOG_LEVEL_COUNT> log_level_colors = {
    "\033[0;31m", // error
    "\033[0;33m", // warn
    "\033[0;37m", // info
    "\033[0;34m", // debug
    "\033[0;35m", // trace
};

inline constexpr std::string_view LOG_COLOR_RESET = "\033[0m";

/// Source of "now" for anything that needs wall-clock time (rotation, backup names)
using time_source = std::function<std::chrono::system_clock::time_point()>;

inline std::chrono::system_clock::time_point system_time_source() { return std::chrono::system_clock::now(); }

namespace detail
{

inline const robin_hood::unordered_map<std::string, log_level> &level_name_table()
{
    static const robin_hood::unordered_map<std::string, log_level> table = {
        {"ERROR", log_level::error},
        {"WARN", log_level::warn},
        {"INFO", log_level::info},
        {"DEBUG", log_level::debug},
        {"TRACE", log_level::trace},
    };
    return table;
}

} // namespace detail

/**
 * @brief Convert string to log_level
 * @param name Level name (case insensitive)
 * @param[out] level Receives the level when the name is recognised
 * @return true if the name was recognised
 *
 * Recognized values: "error", "warn", "info", "debug", "trace"
 */
inline bool log_level_from_string(std::string_view name, log_level &level)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    const auto &table = detail::level_name_table();
    auto it           = table.find(upper);
    if (it == table.end()) return false;

    level = it->second;
    return true;
}

/**
 * @brief Convert log_level to its rendered name
 */
inline std::string_view string_from_log_level(log_level level)
{
    auto idx = static_cast<size_t>(level);
    return idx < LOG_LEVEL_COUNT ? log_level_names[idx] : std::string_view{"UNKNOWN"};
}

/**
 * @brief Whether this platform's terminals understand ANSI escape codes
 */
inline constexpr bool ansi_supported()
{
#ifdef _WIN32
    return false;
#else
    return true;
#endif
}

} // namespace rotalog
