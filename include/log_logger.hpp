/**
 * @file log_logger.hpp
 * @brief Logger facade and the configuration-driven factory
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <array>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include "fmt_config.hpp" // IWYU pragma: keep

#include "log_types.hpp"
#include "log_errors.hpp"
#include "log_config.hpp"
#include "log_pattern.hpp"
#include "log_entry.hpp"
#include "log_entry_pool.hpp"
#include "log_receiver.hpp"
#include "log_receivers.hpp"

namespace rotalog
{

inline constexpr std::string_view DEFAULT_LOG_FILE = "rotalog.log";

/**
 * @brief Call site of a logging statement
 */
struct source_loc
{
    std::string_view file;
    uint32_t line{0};

    static constexpr source_loc from(const std::source_location &l) noexcept
    {
        return source_loc{l.file_name(), static_cast<uint32_t>(l.line())};
    }
};

/**
 * @brief First operand of the plain-values methods, carrying the call site
 */
struct located_message
{
    std::string_view text;
    source_loc loc;

    template <typename S>
        requires std::is_convertible_v<const S &, std::string_view>
    located_message(const S &s, const std::source_location &l = std::source_location::current())
        : text(s), loc(source_loc::from(l))
    {
    }
};

/**
 * @brief Compile-time checked format string carrying the call site
 */
template <typename... Args> struct basic_located_format
{
    fmt::format_string<Args...> str;
    source_loc loc;

    template <typename S>
        requires std::is_convertible_v<const S &, std::string_view>
    consteval basic_located_format(const S &s, const std::source_location &l = std::source_location::current())
        : str(s), loc(source_loc::from(l))
    {
    }
};

template <typename... Args> using located_format = basic_located_format<std::type_identity_t<Args>...>;

/**
 * @brief Level-filtering front end of a receiver
 *
 * @code
 * auto log = make_logger(R"(
 *     receiver = "CONSOLE"
 *     level = "INFO"
 * )");
 * log->info("Welcome ", "to ", "rotalog");          // 2016-07-03 19:22:11.504 INFO  - Welcome to rotalog
 * log->infof("{}, {}, & {}", "simple", "flexible", "powerful");
 * log->debug("not shown at INFO");
 * @endcode
 *
 * Every method returns the receiver's result: empty on success or when the
 * level is filtered out, otherwise the write error. Methods may be called from
 * any number of threads.
 */
class logger
{
  public:
    logger(log_level level, std::shared_ptr<const compiled_pattern> pattern, std::unique_ptr<receiver> recv,
           entry_pool &pool = entry_pool::instance())
        : level_(level)
        , pattern_(std::move(pattern))
        , receiver_(std::move(recv))
        , pool_(&pool)
    {
        if (!receiver_) { throw config_error(log_errc::missing_receiver, "logger requires a receiver"); }
        if (!pattern_) { throw config_error(log_errc::empty_pattern, "logger requires a compiled pattern"); }
    }

    logger(const logger &)            = delete;
    logger &operator=(const logger &) = delete;

    ~logger() { close(); }

    template <typename... Args> std::error_code error(located_message msg, const Args &...values)
    {
        return log_values(log_level::error, msg, values...);
    }
    template <typename... Args> std::error_code errorf(located_format<Args...> format, Args &&...args)
    {
        return log_format(log_level::error, format, std::forward<Args>(args)...);
    }

    template <typename... Args> std::error_code warn(located_message msg, const Args &...values)
    {
        return log_values(log_level::warn, msg, values...);
    }
    template <typename... Args> std::error_code warnf(located_format<Args...> format, Args &&...args)
    {
        return log_format(log_level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args> std::error_code info(located_message msg, const Args &...values)
    {
        return log_values(log_level::info, msg, values...);
    }
    template <typename... Args> std::error_code infof(located_format<Args...> format, Args &&...args)
    {
        return log_format(log_level::info, format, std::forward<Args>(args)...);
    }

    template <typename... Args> std::error_code debug(located_message msg, const Args &...values)
    {
        return log_values(log_level::debug, msg, values...);
    }
    template <typename... Args> std::error_code debugf(located_format<Args...> format, Args &&...args)
    {
        return log_format(log_level::debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args> std::error_code trace(located_message msg, const Args &...values)
    {
        return log_values(log_level::trace, msg, values...);
    }
    template <typename... Args> std::error_code tracef(located_format<Args...> format, Args &&...args)
    {
        return log_format(log_level::trace, format, std::forward<Args>(args)...);
    }

    /**
     * @brief Write a caller-built entry, bypassing the level filter
     */
    std::error_code output(const entry &e) { return receiver_->output(e); }

    void close() { receiver_->close(); }
    bool is_closed() const noexcept { return receiver_->is_closed(); }
    receiver_stats::snapshot get_stats() const noexcept { return receiver_->get_stats(); }

    log_level level() const noexcept { return level_; }
    bool is_enabled(log_level level) const noexcept { return level <= level_; }

    const compiled_pattern &pattern() const noexcept { return *pattern_; }
    receiver &get_receiver() noexcept { return *receiver_; }
    entry_pool &pool() noexcept { return *pool_; }

  private:
    log_level level_;
    std::shared_ptr<const compiled_pattern> pattern_;
    std::unique_ptr<receiver> receiver_;
    entry_pool *pool_;

    entry_ptr make_entry(log_level level, const source_loc &loc)
    {
        entry_ptr e   = pool_->acquire();
        e->level_     = level;
        e->timestamp_ = std::chrono::system_clock::now();
        if (pattern_->needs_file) e->file_ = loc.file;
        if (pattern_->needs_line) e->line_ = loc.line;
        return e;
    }

    template <typename... Args>
    std::error_code log_values(log_level level, const located_message &msg, const Args &...values)
    {
        if (!is_enabled(level)) return {};

        entry_ptr e = make_entry(level, msg.loc);
        if constexpr (sizeof...(Args) == 0) { e->message_template_.assign(msg.text); }
        else
        {
            // A space separates two operands only when neither is a string
            static constexpr std::array<bool, sizeof...(Args) + 1> is_string = {true, is_string_like_v<Args>...};
            e->message_template_.append("{}");
            for (size_t i = 1; i < is_string.size(); ++i)
            {
                if (!is_string[i - 1] && !is_string[i]) e->message_template_.push_back(' ');
                e->message_template_.append("{}");
            }
            e->add_arg(msg.text);
            e->add_args(values...);
        }
        return receiver_->output(*e);
    }

    template <typename Format, typename... Args>
    std::error_code log_format(log_level level, const Format &format, Args &&...args)
    {
        if (!is_enabled(level)) return {};

        entry_ptr e           = make_entry(level, format.loc);
        fmt::string_view tmpl = format.str;
        if constexpr (sizeof...(Args) == 0)
        {
            // Nothing to substitute, store the unescaped text
            e->message_template_ = fmt::format(format.str);
        }
        else
        {
            e->message_template_.assign(tmpl.data(), tmpl.size());
            e->add_args(args...);
        }
        return receiver_->output(*e);
    }
};

/**
 * @brief Process-wide standard logger
 *
 * Writes to stderr with DEFAULT_PATTERN at DEBUG, colour when the terminal
 * supports it. Built on first use; the free functions below forward to it.
 */
inline logger &default_logger()
{
    static const auto pattern = make_pattern(DEFAULT_PATTERN);
    static logger instance(log_level::debug, pattern, make_console_receiver(pattern, true));
    return instance;
}

template <typename... Args> std::error_code error(located_message msg, const Args &...values)
{
    return default_logger().error(msg, values...);
}
template <typename... Args> std::error_code errorf(located_format<Args...> format, Args &&...args)
{
    return default_logger().errorf(format, std::forward<Args>(args)...);
}

template <typename... Args> std::error_code warn(located_message msg, const Args &...values)
{
    return default_logger().warn(msg, values...);
}
template <typename... Args> std::error_code warnf(located_format<Args...> format, Args &&...args)
{
    return default_logger().warnf(format, std::forward<Args>(args)...);
}

template <typename... Args> std::error_code info(located_message msg, const Args &...values)
{
    return default_logger().info(msg, values...);
}
template <typename... Args> std::error_code infof(located_format<Args...> format, Args &&...args)
{
    return default_logger().infof(format, std::forward<Args>(args)...);
}

template <typename... Args> std::error_code debug(located_message msg, const Args &...values)
{
    return default_logger().debug(msg, values...);
}
template <typename... Args> std::error_code debugf(located_format<Args...> format, Args &&...args)
{
    return default_logger().debugf(format, std::forward<Args>(args)...);
}

template <typename... Args> std::error_code trace(located_message msg, const Args &...values)
{
    return default_logger().trace(msg, values...);
}
template <typename... Args> std::error_code tracef(located_format<Args...> format, Args &&...args)
{
    return default_logger().tracef(format, std::forward<Args>(args)...);
}

/**
 * @brief Build a logger from parsed configuration
 *
 * Keys: receiver (CONSOLE|FILE, required), level (default DEBUG), pattern,
 * color (CONSOLE), file, rotate.mode, rotate.size (MB), rotate.lines (FILE).
 *
 * @throws config_error when any setting is missing or invalid, or the log
 *         file cannot be opened
 */
inline std::unique_ptr<logger> make_logger(const log_config &cfg)
{
    auto receiver_type = cfg.find_string("receiver");
    if (!receiver_type) { throw config_error(log_errc::missing_receiver, "receiver configuration is required"); }
    std::transform(receiver_type->begin(), receiver_type->end(), receiver_type->begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::string level_name = cfg.get_string("level", "DEBUG");
    log_level level;
    if (!log_level_from_string(level_name, level))
    {
        throw config_error(log_errc::unrecognized_level, fmt::format("unrecognized log level: {}", level_name));
    }

    auto pattern = make_pattern(cfg.get_string("pattern", DEFAULT_PATTERN));

    std::unique_ptr<receiver> recv;
    if (*receiver_type == "CONSOLE") { recv = make_console_receiver(pattern, cfg.get_bool("color", true)); }
    else if (*receiver_type == "FILE")
    {
        int64_t size_mb = cfg.get_int("rotate.size", ROTATION_DEFAULT_SIZE_MB);
        if (size_mb > ROTATION_MAX_SIZE_MB || size_mb <= 0)
        {
            throw config_error(log_errc::invalid_rotation_size,
                               fmt::format("maximum 2GB file size supported for rotation, got {} MB", size_mb));
        }

        rotate_policy policy;
        policy.mode      = rotate_policy::mode_from_string(cfg.get_string("rotate.mode", "daily"));
        policy.max_bytes = static_cast<uint64_t>(size_mb) * 1024 * 1024;
        policy.max_lines = static_cast<uint64_t>(std::max<int64_t>(cfg.get_int("rotate.lines", 0), 0));

        recv = make_file_receiver(pattern, cfg.get_string("file", DEFAULT_LOG_FILE), policy);
    }
    else
    {
        throw config_error(log_errc::unsupported_receiver, fmt::format("unsupported receiver: {}", *receiver_type));
    }

    return std::make_unique<logger>(level, std::move(pattern), std::move(recv));
}

/**
 * @brief Build a logger from configuration text
 * @throws config_error as make_logger(const log_config &), or empty_config/config_syntax
 */
inline std::unique_ptr<logger> make_logger(std::string_view config)
{
    if (config.find_first_not_of(" \t\r\n") == std::string_view::npos)
    {
        throw config_error(log_errc::empty_config, "logger config is empty");
    }
    return make_logger(log_config::parse(config));
}

} // namespace rotalog
