/**
 * @file log_config.hpp
 * @brief Flat key/value configuration consumed by make_logger()
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Syntax:
 * @code
 * # comment
 * receiver = "FILE"          // comment
 * level = "info"
 * file = "/var/log/app.log"
 * rotate {
 *     mode = "size"
 *     size = 64
 * }
 * rotate.lines = 0            # dotted keys work too
 * @endcode
 *
 * Sections only prefix their keys ("rotate.size"); lookups are always flat.
 */
#pragma once

#include <cstdint>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "robin_hood.h"

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_errors.hpp"

namespace rotalog
{

class log_config
{
  public:
    log_config() = default;

    /**
     * @brief Parse configuration text
     * @throws config_error config_syntax with the offending line number
     */
    static log_config parse(std::string_view text)
    {
        log_config cfg;
        std::vector<std::string> sections;

        size_t line_no = 0;
        size_t pos     = 0;
        while (pos <= text.size())
        {
            size_t eol = text.find('\n', pos);
            if (eol == std::string_view::npos) eol = text.size();
            std::string_view line = text.substr(pos, eol - pos);
            pos                   = eol + 1;
            ++line_no;

            line = trim(strip_comment(line));
            if (line.empty()) continue;

            if (line == "}")
            {
                if (sections.empty()) syntax_error(line_no, "unexpected '}'");
                sections.pop_back();
                continue;
            }

            if (line.back() == '{')
            {
                std::string_view name = trim(line.substr(0, line.size() - 1));
                if (!name.empty() && name.back() == '=') name = trim(name.substr(0, name.size() - 1));
                if (!valid_key(name)) syntax_error(line_no, "invalid section name");
                sections.push_back(qualify(sections, name));
                continue;
            }

            size_t eq = line.find('=');
            if (eq == std::string_view::npos) syntax_error(line_no, "expected key = value");

            std::string_view key   = trim(line.substr(0, eq));
            std::string_view value = trim(line.substr(eq + 1));
            if (!valid_key(key)) syntax_error(line_no, "invalid key");

            std::string parsed;
            if (!unquote(value, parsed)) syntax_error(line_no, "unterminated string");

            cfg.values_[qualify(sections, key)] = std::move(parsed);
        }

        if (!sections.empty()) syntax_error(line_no, fmt::format("section '{}' is not closed", sections.back()));

        return cfg;
    }

    bool has(std::string_view key) const { return values_.find(std::string(key)) != values_.end(); }

    std::optional<std::string> find_string(std::string_view key) const
    {
        auto it = values_.find(std::string(key));
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    std::string get_string(std::string_view key, std::string_view def) const
    {
        auto value = find_string(key);
        return value ? *value : std::string(def);
    }

    /**
     * @throws config_error config_syntax when the value is not an integer
     */
    int64_t get_int(std::string_view key, int64_t def) const
    {
        auto value = find_string(key);
        if (!value) return def;

        int64_t result   = 0;
        const char *last = value->data() + value->size();
        auto [ptr, ec]   = std::from_chars(value->data(), last, result);
        if (ec != std::errc{} || ptr != last)
        {
            throw config_error(log_errc::config_syntax, fmt::format("'{}' is not an integer: {}", key, *value));
        }
        return result;
    }

    /**
     * @throws config_error config_syntax when the value is not true/false
     */
    bool get_bool(std::string_view key, bool def) const
    {
        auto value = find_string(key);
        if (!value) return def;
        if (*value == "true" || *value == "yes" || *value == "on") return true;
        if (*value == "false" || *value == "no" || *value == "off") return false;
        throw config_error(log_errc::config_syntax, fmt::format("'{}' is not a boolean: {}", key, *value));
    }

    void set(std::string_view key, std::string_view value) { values_[std::string(key)] = std::string(value); }

    size_t size() const noexcept { return values_.size(); }

  private:
    robin_hood::unordered_map<std::string, std::string> values_;

    [[noreturn]] static void syntax_error(size_t line_no, std::string_view what)
    {
        throw config_error(log_errc::config_syntax, fmt::format("config line {}: {}", line_no, what));
    }

    static std::string_view trim(std::string_view s)
    {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
        return s;
    }

    // Drops a trailing '#' or '//' comment that is not inside quotes
    static std::string_view strip_comment(std::string_view line)
    {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i)
        {
            char c = line[i];
            if (quoted)
            {
                if (c == '\\') ++i;
                else if (c == '"') quoted = false;
                continue;
            }
            if (c == '"') quoted = true;
            else if (c == '#') return line.substr(0, i);
            else if (c == '/' && i + 1 < line.size() && line[i + 1] == '/') return line.substr(0, i);
        }
        return line;
    }

    static bool valid_key(std::string_view key)
    {
        if (key.empty()) return false;
        for (char c : key)
        {
            bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
                      c == '-' || c == '.';
            if (!ok) return false;
        }
        return true;
    }

    static std::string qualify(const std::vector<std::string> &sections, std::string_view key)
    {
        if (sections.empty()) return std::string(key);
        return fmt::format("{}.{}", sections.back(), key);
    }

    static bool unquote(std::string_view value, std::string &out)
    {
        if (value.empty() || value.front() != '"')
        {
            out.assign(value);
            return true;
        }

        for (size_t i = 1; i < value.size(); ++i)
        {
            char c = value[i];
            if (c == '"') return i == value.size() - 1;
            if (c == '\\' && i + 1 < value.size())
            {
                char n = value[++i];
                switch (n)
                {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                default: out.push_back(n); break;
                }
                continue;
            }
            out.push_back(c);
        }
        return false;
    }
};

} // namespace rotalog
