/**
 * @file log_pattern.hpp
 * @brief Compiles textual log patterns into format directives
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A pattern is free text with flags introduced by '%':
 * @code
 * "%time:2006-01-02 15:04:05.000 %level:-5 %custom:- %message"
 * // 2016-07-03 19:22:11.504 INFO  - Welcome to rotalog
 * @endcode
 *
 * Flags:
 * - level     - ERROR, WARN, INFO, DEBUG or TRACE
 * - time      - local time, value is a reference-time layout (see log_time_layout.hpp)
 * - utctime   - UTC time, value is a reference-time layout
 * - longfile  - full source file name: /a/b/c/d.cpp
 * - shortfile - final file name element: d.cpp
 * - line      - source line number: L23
 * - message   - the message rendered with its arguments
 * - custom    - its value, as-is
 *
 * A value follows the flag name after ':' and runs up to the next '%'.
 * Trailing whitespace of a value is the separator before the next flag and
 * is emitted as literal text. level, longfile, shortfile, line and message
 * accept a padding value "[-]width" ('-' left aligns). "%%" emits '%'.
 *
 * Compilation happens once; the resulting directive list is shared read-only
 * by every render.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "robin_hood.h"

#include "log_errors.hpp"
#include "log_time_layout.hpp"

namespace rotalog
{

inline constexpr char PATTERN_FLAG_MARKER    = '%';
inline constexpr char PATTERN_VALUE_SEPARATOR = ':';

inline constexpr std::string_view DEFAULT_PATTERN     = "%time:2006-01-02 15:04:05.000 %level:-5 %custom:- %message";
inline constexpr std::string_view DEFAULT_TIME_LAYOUT = "2006-01-02 15:04:05.000";

/**
 * @brief What a format directive renders
 */
enum class directive_kind : uint8_t
{
    level,
    time,
    utc_time,
    long_file,
    short_file,
    line,
    message,
    literal,
};

/**
 * @brief One compiled unit of a pattern
 */
struct format_directive
{
    directive_kind kind;
    std::string aux;         ///< Raw value text; the literal text for literal directives
    uint16_t width{0};       ///< Padding width, 0 = none
    bool left_align{false};  ///< Pad on the right
    time_layout layout{};    ///< Compiled layout for time and utc_time
};

/**
 * @brief Immutable result of compile_pattern()
 */
struct compiled_pattern
{
    std::string source;
    std::vector<format_directive> directives;
    bool needs_file{false}; ///< longfile or shortfile present
    bool needs_line{false}; ///< line present
};

namespace detail
{

inline const robin_hood::unordered_map<std::string_view, directive_kind> &flag_table()
{
    static const robin_hood::unordered_map<std::string_view, directive_kind> table = {
        {"level", directive_kind::level},
        {"time", directive_kind::time},
        {"utctime", directive_kind::utc_time},
        {"longfile", directive_kind::long_file},
        {"shortfile", directive_kind::short_file},
        {"line", directive_kind::line},
        {"message", directive_kind::message},
        {"custom", directive_kind::literal},
    };
    return table;
}

inline bool is_flag_name_char(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

inline bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

// Parses "[-]width" into the directive, returns false when malformed
inline bool parse_padding(std::string_view value, format_directive &directive)
{
    if (value.empty()) return true;

    size_t pos = 0;
    if (value[0] == '-')
    {
        directive.left_align = true;
        pos                  = 1;
    }
    if (pos == value.size()) return false;

    uint32_t width = 0;
    for (; pos < value.size(); ++pos)
    {
        char c = value[pos];
        if (c < '0' || c > '9') return false;
        width = width * 10 + static_cast<uint32_t>(c - '0');
        if (width > UINT16_MAX) return false;
    }
    directive.width = static_cast<uint16_t>(width);
    return true;
}

} // namespace detail

/**
 * @brief Compile a pattern string
 * @param pattern The pattern text
 * @return Directive list in the order the flags appear
 * @throws config_error empty_pattern, unrecognized_flag or invalid_flag_value
 */
inline compiled_pattern compile_pattern(std::string_view pattern)
{
    if (pattern.empty()) { throw config_error(log_errc::empty_pattern, "log format string is empty"); }

    compiled_pattern result;
    result.source = std::string(pattern);

    std::string literal;
    auto flush_literal = [&]()
    {
        if (!literal.empty())
        {
            format_directive d{directive_kind::literal};
            d.aux = std::move(literal);
            result.directives.push_back(std::move(d));
            literal.clear();
        }
    };

    const auto &flags = detail::flag_table();
    size_t pos        = 0;
    while (pos < pattern.size())
    {
        char c = pattern[pos];
        if (c != PATTERN_FLAG_MARKER)
        {
            literal.push_back(c);
            ++pos;
            continue;
        }

        if (pos + 1 < pattern.size() && pattern[pos + 1] == PATTERN_FLAG_MARKER)
        {
            literal.push_back(PATTERN_FLAG_MARKER);
            pos += 2;
            continue;
        }

        // Flag name
        size_t name_start = ++pos;
        while (pos < pattern.size() && detail::is_flag_name_char(pattern[pos])) ++pos;
        std::string_view name = pattern.substr(name_start, pos - name_start);

        auto it = flags.find(name);
        if (it == flags.end())
        {
            size_t end = pattern.find(PATTERN_FLAG_MARKER, pos);
            std::string_view shown = pattern.substr(name_start, (end == std::string_view::npos ? pattern.size() : end) - name_start);
            throw config_error(log_errc::unrecognized_flag, fmt::format("unrecognized format flag: {}", shown));
        }

        format_directive directive{it->second};

        // Optional value, runs up to the next marker
        bool has_value = false;
        std::string_view value;
        std::string_view trailing;
        if (pos < pattern.size() && pattern[pos] == PATTERN_VALUE_SEPARATOR)
        {
            has_value   = true;
            size_t end  = pattern.find(PATTERN_FLAG_MARKER, pos + 1);
            if (end == std::string_view::npos) end = pattern.size();
            value       = pattern.substr(pos + 1, end - pos - 1);
            size_t keep = value.size();
            while (keep > 0 && detail::is_space(value[keep - 1])) --keep;
            trailing = value.substr(keep);
            value    = value.substr(0, keep);
            pos      = end;
        }

        switch (directive.kind)
        {
        case directive_kind::time:
        case directive_kind::utc_time:
            directive.aux    = std::string(has_value && !value.empty() ? value : DEFAULT_TIME_LAYOUT);
            directive.layout = time_layout::compile(directive.aux);
            break;
        case directive_kind::literal:
            directive.aux = std::string(value);
            break;
        default:
            directive.aux = std::string(value);
            if (!detail::parse_padding(value, directive))
            {
                throw config_error(log_errc::invalid_flag_value,
                                   fmt::format("invalid value for format flag {}: {}", name, value));
            }
            break;
        }

        if (directive.kind == directive_kind::long_file || directive.kind == directive_kind::short_file)
        {
            result.needs_file = true;
        }
        if (directive.kind == directive_kind::line) { result.needs_line = true; }

        flush_literal();
        if (directive.kind != directive_kind::literal || !directive.aux.empty())
        {
            result.directives.push_back(std::move(directive));
        }
        literal.append(trailing);
    }
    flush_literal();

    return result;
}

/**
 * @brief Compile a pattern into a shareable, immutable object
 */
inline std::shared_ptr<const compiled_pattern> make_pattern(std::string_view pattern)
{
    return std::make_shared<const compiled_pattern>(compile_pattern(pattern));
}

} // namespace rotalog
