/**
 * @file test_time_layout.cpp
 * @brief Tests for reference-time layouts
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>

#include "log_time_layout.hpp"

using namespace rotalog;
using namespace std::chrono;

namespace
{

// 2016-07-03 19:22:11.504 UTC, a Sunday
const system_clock::time_point afternoon = system_clock::time_point(seconds(1467573731)) + milliseconds(504);

// 2016-07-03 07:05:09 UTC
const system_clock::time_point morning = system_clock::time_point(seconds(1467529509));

std::string render_utc(std::string_view layout, system_clock::time_point tp)
{
    fmt::memory_buffer out;
    time_layout::compile(layout).render(tp, true, out);
    return fmt::to_string(out);
}

} // namespace

TEST_CASE("Time layout numeric elements", "[time_layout]")
{
    SECTION("Default layout")
    {
        REQUIRE(render_utc("2006-01-02 15:04:05.000", afternoon) == "2016-07-03 19:22:11.504");
    }

    SECTION("Short year and unpadded fields")
    {
        REQUIRE(render_utc("06/1/2 3:4:5", morning) == "16/7/3 7:5:9");
    }

    SECTION("Zero padded fields")
    {
        REQUIRE(render_utc("01-02 03:04:05", morning) == "07-03 07:05:09");
    }

    SECTION("Space padded day")
    {
        REQUIRE(render_utc("Jan _2", morning) == "Jul  3");
    }

    SECTION("12 hour clock")
    {
        REQUIRE(render_utc("3:04PM", afternoon) == "7:22PM");
        REQUIRE(render_utc("03:04pm", morning) == "07:05am");
    }
}

TEST_CASE("Time layout names", "[time_layout]")
{
    REQUIRE(render_utc("Monday, January 2", afternoon) == "Sunday, July 3");
    REQUIRE(render_utc("Mon Jan", afternoon) == "Sun Jul");
}

TEST_CASE("Time layout fractions", "[time_layout]")
{
    SECTION("Fixed digits")
    {
        REQUIRE(render_utc("05.000", afternoon) == "11.504");
        REQUIRE(render_utc("05,000000", afternoon) == "11,504000");
        REQUIRE(render_utc("05.0", afternoon) == "11.5");
    }

    SECTION("Trimmed digits")
    {
        REQUIRE(render_utc("05.999", afternoon) == "11.504");
        REQUIRE(render_utc("05.999999", afternoon) == "11.504");
        REQUIRE(render_utc("05.999", morning) == "09");
    }
}

TEST_CASE("Time layout zones in UTC", "[time_layout]")
{
    REQUIRE(render_utc("MST", afternoon) == "UTC");
    REQUIRE(render_utc("-0700", afternoon) == "+0000");
    REQUIRE(render_utc("-07:00", afternoon) == "+00:00");
    REQUIRE(render_utc("-07", afternoon) == "+00");
    REQUIRE(render_utc("Z0700", afternoon) == "Z");
    REQUIRE(render_utc("Z07:00", afternoon) == "Z");
}

TEST_CASE("Time layout literals", "[time_layout]")
{
    SECTION("Unrecognised text is copied")
    {
        REQUIRE(render_utc("[15h]", afternoon) == "[19h]");
        REQUIRE(render_utc("at 15:04 UTC", afternoon) == "at 19:22 UTC");
    }

    SECTION("Empty layout renders nothing")
    {
        auto layout = time_layout::compile("");
        REQUIRE(layout.empty());
        REQUIRE(render_utc("", afternoon).empty());
    }

    SECTION("Source is kept")
    {
        auto layout = time_layout::compile("15:04");
        REQUIRE(layout.source() == "15:04");
        REQUIRE(layout.tokens().size() == 3);
    }
}
