/**
 * @file log_errors.hpp
 * @brief Error codes and exception types reported by rotalog
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Two channels are used:
 * - Construction (pattern compilation, configuration, opening the log file)
 *   throws config_error. No partially built logger or receiver is returned.
 * - The write path returns std::error_code. It never throws and never aborts;
 *   a failed call does not prevent later calls from being attempted.
 *
 * log_errc values belong to rotalog_category(). Failures of system calls are
 * reported with std::system_category() and the errno of the failed call.
 */
#pragma once

#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace rotalog
{

/**
 * @brief rotalog specific error conditions
 */
enum class log_errc
{
    empty_config = 1,         ///< Configuration string is empty
    config_syntax,            ///< Configuration string could not be parsed
    missing_receiver,         ///< No receiver type configured
    unsupported_receiver,     ///< Receiver type is neither CONSOLE nor FILE
    unrecognized_level,       ///< Level name is not one of ERROR, WARN, INFO, DEBUG, TRACE
    empty_pattern,            ///< Format pattern is empty
    unrecognized_flag,        ///< Format pattern names an unknown flag
    invalid_flag_value,       ///< Format flag carries an unusable auxiliary value
    invalid_rotation_size,    ///< rotate.size is outside 1..2048 MB
    writer_closed,            ///< Write attempted after close()
    format_failed,            ///< Message template does not match its arguments
};

namespace detail
{

class log_category final : public std::error_category
{
  public:
    const char *name() const noexcept override { return "rotalog"; }

    std::string message(int val) const override
    {
        switch (static_cast<log_errc>(val))
        {
        case log_errc::empty_config: return "logger config is empty";
        case log_errc::config_syntax: return "logger config could not be parsed";
        case log_errc::missing_receiver: return "receiver configuration is required";
        case log_errc::unsupported_receiver: return "unsupported receiver";
        case log_errc::unrecognized_level: return "unrecognized log level";
        case log_errc::empty_pattern: return "log format string is empty";
        case log_errc::unrecognized_flag: return "unrecognized format flag";
        case log_errc::invalid_flag_value: return "invalid format flag value";
        case log_errc::invalid_rotation_size: return "maximum 2GB file size supported for rotation";
        case log_errc::writer_closed: return "log writer is closed";
        case log_errc::format_failed: return "log message could not be formatted";
        }
        return "unknown rotalog error";
    }
};

} // namespace detail

inline const std::error_category &rotalog_category() noexcept
{
    static const detail::log_category category;
    return category;
}

inline std::error_code make_error_code(log_errc e) noexcept
{
    return {static_cast<int>(e), rotalog_category()};
}

/**
 * @brief Thrown when a logger, receiver or pattern cannot be constructed
 *
 * code() is either a log_errc or, for file open failures, the errno of the
 * failed call in std::system_category(). what() is the detailed message
 * alone for log_errc failures and "what: strerror" for system failures.
 */
class config_error : public std::system_error
{
  public:
    explicit config_error(log_errc e) : std::system_error(make_error_code(e)), what_(code().message()) {}
    config_error(log_errc e, std::string what) : std::system_error(make_error_code(e)), what_(std::move(what)) {}
    config_error(std::error_code ec, const std::string &what)
        : std::system_error(ec, what)
        , what_(std::system_error::what())
    {
    }

    const char *what() const noexcept override { return what_.c_str(); }

  private:
    std::string what_;
};

} // namespace rotalog

namespace std
{
template <> struct is_error_code_enum<rotalog::log_errc> : true_type
{
};
} // namespace std
