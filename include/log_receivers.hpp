/**
 * @file log_receivers.hpp
 * @brief Factory functions for the console and file receivers
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unistd.h>

#include "log_receiver.hpp"
#include "log_formatters.hpp"
#include "log_writers.hpp"
#include "log_file_rotator.hpp"

namespace rotalog
{

/// Writes to standard error, optionally coloured by level
using console_receiver = basic_receiver<fd_writer>;

/// Writes to a file with daily, size or line rotation
using file_receiver = basic_receiver<rotating_file_writer>;

/**
 * @brief Create a console receiver
 * @param pattern Compiled pattern shared with the logger
 * @param use_color Colour lines by level; only honoured where ANSI is supported
 * @param fd Output descriptor, standard error unless redirected (e.g. in tests)
 */
inline std::unique_ptr<console_receiver> make_console_receiver(std::shared_ptr<const compiled_pattern> pattern,
                                                               bool use_color = true, int fd = STDERR_FILENO)
{
    return std::make_unique<console_receiver>(
        pattern_formatter{
            .pattern   = std::move(pattern),
            .use_color = use_color && ansi_supported(),
        },
        fd);
}

/**
 * @brief Create a file receiver
 * @throws config_error if the file cannot be opened
 */
inline std::unique_ptr<file_receiver> make_file_receiver(std::shared_ptr<const compiled_pattern> pattern,
                                                         const std::string_view &filename, rotate_policy policy = {},
                                                         time_source now = system_time_source)
{
    return std::make_unique<file_receiver>(
        pattern_formatter{
            .pattern   = std::move(pattern),
            .use_color = false,
        },
        std::string(filename), policy, std::move(now));
}

} // namespace rotalog
