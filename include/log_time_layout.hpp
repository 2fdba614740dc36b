/**
 * @file log_time_layout.hpp
 * @brief Reference-time layouts for the time and utctime format flags
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A layout is written as the reference time `Mon Jan 2 15:04:05 MST 2006`
 * would be displayed, e.g. "2006-01-02 15:04:05.000". Layouts are used
 * instead of strftime() conversions because '%' is the pattern flag marker.
 *
 * Recognised elements:
 * @code
 * Year:      2006 06
 * Month:     January Jan 01 1
 * Weekday:   Monday Mon
 * Day:       02 _2 2
 * Hour:      15 03 3
 * Minute:    04 4
 * Second:    05 5
 * Fraction:  .000 ,000 (fixed digits)  .999 ,999 (trailing zeros trimmed)
 * AM/PM:     PM pm
 * Zone:      MST -0700 -07:00 -07 Z0700 Z07:00
 * @endcode
 * Anything else is copied as-is. Layouts are compiled once into a token list
 * and rendering only walks that list.
 */
#pragma once

#include <cstdint>
#include <ctime>
#include <array>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace rotalog
{

class time_layout
{
  public:
    enum class token_kind : uint8_t
    {
        literal,
        year4,
        year2,
        month_long,
        month_short,
        month_num2,
        month_num,
        weekday_long,
        weekday_short,
        day2,
        day_space,
        day,
        hour24,
        hour12_2,
        hour12,
        minute2,
        minute,
        second2,
        second,
        frac_fixed,
        frac_trim,
        pm_upper,
        pm_lower,
        zone_name,
        tz_hhmm,
        tz_hh_colon_mm,
        tz_hh,
        tz_z_hhmm,
        tz_z_hh_colon_mm,
    };

    struct token
    {
        token_kind kind;
        uint8_t digits{0};  ///< Fraction digits
        char separator{0};  ///< Fraction separator ('.' or ',')
        std::string text{}; ///< Literal text
    };

    time_layout() = default;

    /**
     * @brief Compile a layout string into a token list
     */
    static time_layout compile(std::string_view layout)
    {
        time_layout result;
        result.source_ = std::string(layout);

        std::string pending;
        auto flush_literal = [&]()
        {
            if (!pending.empty())
            {
                result.tokens_.push_back(token{token_kind::literal, 0, 0, std::move(pending)});
                pending.clear();
            }
        };
        auto emit = [&](token_kind kind)
        {
            flush_literal();
            result.tokens_.push_back(token{kind});
        };

        size_t i = 0;
        while (i < layout.size())
        {
            std::string_view rest = layout.substr(i);
            char c                = layout[i];

            switch (c)
            {
            case 'J':
                if (rest.starts_with("January")) { emit(token_kind::month_long); i += 7; continue; }
                if (rest.starts_with("Jan")) { emit(token_kind::month_short); i += 3; continue; }
                break;
            case 'M':
                if (rest.starts_with("Monday")) { emit(token_kind::weekday_long); i += 6; continue; }
                if (rest.starts_with("Mon")) { emit(token_kind::weekday_short); i += 3; continue; }
                if (rest.starts_with("MST")) { emit(token_kind::zone_name); i += 3; continue; }
                break;
            case '0':
                if (rest.size() >= 2 && rest[1] >= '1' && rest[1] <= '6')
                {
                    static constexpr std::array<token_kind, 6> zero_kinds = {
                        token_kind::month_num2, token_kind::day2,    token_kind::hour12_2,
                        token_kind::minute2,    token_kind::second2, token_kind::year2,
                    };
                    emit(zero_kinds[rest[1] - '1']);
                    i += 2;
                    continue;
                }
                break;
            case '1':
                if (rest.starts_with("15")) { emit(token_kind::hour24); i += 2; continue; }
                emit(token_kind::month_num);
                i += 1;
                continue;
            case '2':
                if (rest.starts_with("2006")) { emit(token_kind::year4); i += 4; continue; }
                emit(token_kind::day);
                i += 1;
                continue;
            case '_':
                if (rest.starts_with("_2") && !rest.starts_with("_2006"))
                {
                    emit(token_kind::day_space);
                    i += 2;
                    continue;
                }
                break;
            case '3': emit(token_kind::hour12); i += 1; continue;
            case '4': emit(token_kind::minute); i += 1; continue;
            case '5': emit(token_kind::second); i += 1; continue;
            case 'P':
                if (rest.starts_with("PM")) { emit(token_kind::pm_upper); i += 2; continue; }
                break;
            case 'p':
                if (rest.starts_with("pm")) { emit(token_kind::pm_lower); i += 2; continue; }
                break;
            case '-':
                if (rest.starts_with("-0700")) { emit(token_kind::tz_hhmm); i += 5; continue; }
                if (rest.starts_with("-07:00")) { emit(token_kind::tz_hh_colon_mm); i += 6; continue; }
                if (rest.starts_with("-07")) { emit(token_kind::tz_hh); i += 3; continue; }
                break;
            case 'Z':
                if (rest.starts_with("Z0700")) { emit(token_kind::tz_z_hhmm); i += 5; continue; }
                if (rest.starts_with("Z07:00")) { emit(token_kind::tz_z_hh_colon_mm); i += 6; continue; }
                break;
            case '.':
            case ',':
                if (rest.size() >= 2 && (rest[1] == '0' || rest[1] == '9'))
                {
                    char digit = rest[1];
                    size_t j   = 1;
                    while (j < rest.size() && rest[j] == digit) ++j;
                    bool followed_by_digit = j < rest.size() && rest[j] >= '0' && rest[j] <= '9';
                    if (!followed_by_digit && j - 1 <= 9)
                    {
                        flush_literal();
                        result.tokens_.push_back(token{digit == '0' ? token_kind::frac_fixed : token_kind::frac_trim,
                                                       static_cast<uint8_t>(j - 1), c});
                        i += j;
                        continue;
                    }
                }
                break;
            default: break;
            }

            pending.push_back(c);
            ++i;
        }
        flush_literal();

        return result;
    }

    /**
     * @brief Render a point in time, in local time or UTC
     */
    void render(std::chrono::system_clock::time_point tp, bool utc, fmt::memory_buffer &out) const
    {
        using namespace std::chrono;

        auto since_epoch = tp.time_since_epoch();
        auto secs        = floor<seconds>(since_epoch);
        auto nanos       = static_cast<uint32_t>(duration_cast<nanoseconds>(since_epoch - secs).count());
        std::time_t tt   = static_cast<std::time_t>(secs.count());

        std::tm tm{};
        long gmt_offset       = 0;
        std::string_view zone = "UTC";
        if (utc) { gmtime_r(&tt, &tm); }
        else
        {
            localtime_r(&tt, &tm);
            gmt_offset = tm.tm_gmtoff;
            if (tm.tm_zone) zone = tm.tm_zone;
        }

        static constexpr std::array<std::string_view, 12> months = {
            "January", "February", "March",     "April",   "May",      "June",
            "July",    "August",   "September", "October", "November", "December",
        };
        static constexpr std::array<std::string_view, 7> weekdays = {
            "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday",
        };

        auto it     = fmt::appender(out);
        int hour12  = tm.tm_hour % 12 == 0 ? 12 : tm.tm_hour % 12;
        long offmin = gmt_offset / 60;
        char sign   = offmin < 0 ? '-' : '+';
        long absmin = offmin < 0 ? -offmin : offmin;

        for (const auto &t : tokens_)
        {
            switch (t.kind)
            {
            case token_kind::literal: out.append(t.text); break;
            case token_kind::year4: fmt::format_to(it, "{:04}", tm.tm_year + 1900); break;
            case token_kind::year2: fmt::format_to(it, "{:02}", (tm.tm_year + 1900) % 100); break;
            case token_kind::month_long: out.append(months[tm.tm_mon]); break;
            case token_kind::month_short: out.append(months[tm.tm_mon].substr(0, 3)); break;
            case token_kind::month_num2: fmt::format_to(it, "{:02}", tm.tm_mon + 1); break;
            case token_kind::month_num: fmt::format_to(it, "{}", tm.tm_mon + 1); break;
            case token_kind::weekday_long: out.append(weekdays[tm.tm_wday]); break;
            case token_kind::weekday_short: out.append(weekdays[tm.tm_wday].substr(0, 3)); break;
            case token_kind::day2: fmt::format_to(it, "{:02}", tm.tm_mday); break;
            case token_kind::day_space: fmt::format_to(it, "{:>2}", tm.tm_mday); break;
            case token_kind::day: fmt::format_to(it, "{}", tm.tm_mday); break;
            case token_kind::hour24: fmt::format_to(it, "{:02}", tm.tm_hour); break;
            case token_kind::hour12_2: fmt::format_to(it, "{:02}", hour12); break;
            case token_kind::hour12: fmt::format_to(it, "{}", hour12); break;
            case token_kind::minute2: fmt::format_to(it, "{:02}", tm.tm_min); break;
            case token_kind::minute: fmt::format_to(it, "{}", tm.tm_min); break;
            case token_kind::second2: fmt::format_to(it, "{:02}", tm.tm_sec); break;
            case token_kind::second: fmt::format_to(it, "{}", tm.tm_sec); break;
            case token_kind::frac_fixed:
            case token_kind::frac_trim: render_fraction(t, nanos, out); break;
            case token_kind::pm_upper: out.append(std::string_view(tm.tm_hour >= 12 ? "PM" : "AM")); break;
            case token_kind::pm_lower: out.append(std::string_view(tm.tm_hour >= 12 ? "pm" : "am")); break;
            case token_kind::zone_name: out.append(zone); break;
            case token_kind::tz_hhmm: fmt::format_to(it, "{}{:02}{:02}", sign, absmin / 60, absmin % 60); break;
            case token_kind::tz_hh_colon_mm: fmt::format_to(it, "{}{:02}:{:02}", sign, absmin / 60, absmin % 60); break;
            case token_kind::tz_hh: fmt::format_to(it, "{}{:02}", sign, absmin / 60); break;
            case token_kind::tz_z_hhmm:
                if (offmin == 0) out.push_back('Z');
                else fmt::format_to(it, "{}{:02}{:02}", sign, absmin / 60, absmin % 60);
                break;
            case token_kind::tz_z_hh_colon_mm:
                if (offmin == 0) out.push_back('Z');
                else fmt::format_to(it, "{}{:02}:{:02}", sign, absmin / 60, absmin % 60);
                break;
            }
        }
    }

    const std::vector<token> &tokens() const noexcept { return tokens_; }
    const std::string &source() const noexcept { return source_; }
    bool empty() const noexcept { return tokens_.empty(); }

  private:
    std::vector<token> tokens_;
    std::string source_;

    static void render_fraction(const token &t, uint32_t nanos, fmt::memory_buffer &out)
    {
        char digits[9];
        uint32_t v = nanos;
        for (int i = 8; i >= 0; --i)
        {
            digits[i] = static_cast<char>('0' + v % 10);
            v /= 10;
        }

        size_t n = t.digits;
        if (t.kind == token_kind::frac_trim)
        {
            while (n > 0 && digits[n - 1] == '0') --n;
            if (n == 0) return;
        }
        out.push_back(t.separator);
        out.append(std::string_view(digits, n));
    }
};

} // namespace rotalog
