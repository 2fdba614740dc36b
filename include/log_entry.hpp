/**
 * @file log_entry.hpp
 * @brief A single log occurrence, reused through the entry pool
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"

namespace rotalog
{

/**
 * @brief Types rendered as strings by the plain-values form
 *
 * Two adjacent operands are separated by a space only when neither of them
 * is string-like.
 */
template <typename T>
inline constexpr bool is_string_like_v = std::is_convertible_v<const std::decay_t<T> &, std::string_view>;

/**
 * @brief One log occurrence: level, time, message template, arguments and source location
 *
 * Entries are filled by the logger, rendered by a receiver and then reset and
 * returned to the pool. Arguments are stored type-erased in an
 * fmt::dynamic_format_arg_store; strings are copied so the entry never refers
 * to caller storage.
 */
class entry
{
  public:
    log_level level_{log_level::error};
    std::chrono::system_clock::time_point timestamp_{};
    std::string message_template_;
    std::string_view file_;
    uint32_t line_{0};

    entry() = default;

    // Pooled objects don't copy or move
    entry(const entry &)            = delete;
    entry &operator=(const entry &) = delete;
    entry(entry &&)                 = delete;
    entry &operator=(entry &&)      = delete;

    /**
     * @brief Append one argument
     */
    template <typename T> entry &add_arg(const T &value)
    {
        if constexpr (is_string_like_v<T>) { args_.push_back(std::string(std::string_view(value))); }
        else { args_.push_back(value); }
        ++arg_count_;
        return *this;
    }

    template <typename... Args> entry &add_args(const Args &...values)
    {
        (add_arg(values), ...);
        return *this;
    }

    size_t arg_count() const noexcept { return arg_count_; }
    const fmt::dynamic_format_arg_store<fmt::format_context> &args() const noexcept { return args_; }

    /**
     * @brief Zero every field so nothing leaks into the next use
     *
     * The template string keeps its capacity.
     */
    void reset() noexcept
    {
        level_     = log_level::error;
        timestamp_ = {};
        message_template_.clear();
        file_ = {};
        line_ = 0;
        args_.clear();
        arg_count_ = 0;
    }

  private:
    fmt::dynamic_format_arg_store<fmt::format_context> args_;
    size_t arg_count_{0};
};

} // namespace rotalog
