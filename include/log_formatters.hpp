/**
 * @file log_formatters.hpp
 * @brief Renders log entries through a compiled pattern
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstring>
#include <memory>
#include <string_view>

#include "fmt_config.hpp" // IWYU pragma: keep

#include "log_types.hpp"
#include "log_entry.hpp"
#include "log_pattern.hpp"

namespace rotalog
{

/**
 * @brief Formatter driven by a compiled pattern
 *
 * Appends one complete line to the output buffer: the directives in order,
 * then '\n'. With use_color the content is wrapped in the level colour and a
 * reset sequence, placed before the newline.
 *
 * format() returns the number of semantic bytes (content plus newline). Colour
 * escapes are decoration and are not part of that count.
 *
 * @throws fmt::format_error when a message template does not match its arguments
 */
class pattern_formatter
{
  public:
    std::shared_ptr<const compiled_pattern> pattern;
    bool use_color = false;

    size_t format(const entry &e, fmt::memory_buffer &out) const
    {
        if (!pattern) return 0;

        bool colored = use_color && static_cast<size_t>(e.level_) < LOG_LEVEL_COUNT;
        if (colored) { out.append(log_level_colors[static_cast<size_t>(e.level_)]); }

        size_t content_start = out.size();
        for (const auto &directive : pattern->directives) { render_directive(directive, e, out); }
        size_t content = out.size() - content_start;

        if (colored) { out.append(LOG_COLOR_RESET); }
        out.push_back('\n');

        return content + 1;
    }

    /**
     * @brief Render just the message part of an entry
     */
    static void format_message(const entry &e, fmt::memory_buffer &out)
    {
        if (e.arg_count() == 0)
        {
            out.append(e.message_template_);
            return;
        }

        if (e.message_template_.empty())
        {
            // Default form: every argument with {} separated by a space
            fmt::basic_memory_buffer<char, 128> tmpl;
            for (size_t i = 0; i < e.arg_count(); ++i)
            {
                if (i > 0) tmpl.push_back(' ');
                tmpl.append(std::string_view("{}"));
            }
            fmt::vformat_to(fmt::appender(out), fmt::string_view(tmpl.data(), tmpl.size()), fmt::format_args(e.args()));
            return;
        }

        fmt::vformat_to(fmt::appender(out), fmt::string_view(e.message_template_), fmt::format_args(e.args()));
    }

  private:
    static std::string_view short_file_name(std::string_view path)
    {
        auto slash = path.find_last_of('/');
        return slash == std::string_view::npos ? path : path.substr(slash + 1);
    }

    static void append_padded(const format_directive &d, std::string_view value, fmt::memory_buffer &out)
    {
        if (d.width == 0 || value.size() >= d.width)
        {
            out.append(value);
            return;
        }

        if (d.left_align) { fmt::format_to(fmt::appender(out), "{:<{}}", value, d.width); }
        else { fmt::format_to(fmt::appender(out), "{:>{}}", value, d.width); }
    }

    void render_directive(const format_directive &d, const entry &e, fmt::memory_buffer &out) const
    {
        switch (d.kind)
        {
        case directive_kind::literal: out.append(d.aux); break;
        case directive_kind::level: append_padded(d, string_from_log_level(e.level_), out); break;
        case directive_kind::time: d.layout.render(e.timestamp_, false, out); break;
        case directive_kind::utc_time: d.layout.render(e.timestamp_, true, out); break;
        case directive_kind::long_file: append_padded(d, e.file_.empty() ? "???" : e.file_, out); break;
        case directive_kind::short_file:
            append_padded(d, e.file_.empty() ? "???" : short_file_name(e.file_), out);
            break;
        case directive_kind::line:
        {
            fmt::basic_memory_buffer<char, 16> tmp;
            fmt::format_to(fmt::appender(tmp), "L{}", e.line_);
            append_padded(d, std::string_view(tmp.data(), tmp.size()), out);
            break;
        }
        case directive_kind::message:
            if (d.width == 0) { format_message(e, out); }
            else
            {
                fmt::memory_buffer tmp;
                format_message(e, tmp);
                append_padded(d, std::string_view(tmp.data(), tmp.size()), out);
            }
            break;
        }
    }
};

} // namespace rotalog
