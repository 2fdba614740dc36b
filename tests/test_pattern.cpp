/**
 * @file test_pattern.cpp
 * @brief Tests for pattern compilation
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <string>
#include <system_error>

#include "log_pattern.hpp"

using namespace rotalog;

namespace
{

std::error_code compile_error(std::string_view pattern)
{
    try
    {
        compile_pattern(pattern);
    }
    catch (const config_error &e)
    {
        return e.code();
    }
    return {};
}

} // namespace

TEST_CASE("Default pattern compiles", "[pattern]")
{
    auto p = compile_pattern(DEFAULT_PATTERN);

    REQUIRE(p.source == DEFAULT_PATTERN);
    REQUIRE(p.directives.size() == 7);

    REQUIRE(p.directives[0].kind == directive_kind::time);
    REQUIRE(p.directives[0].aux == "2006-01-02 15:04:05.000");
    REQUIRE_FALSE(p.directives[0].layout.empty());

    REQUIRE(p.directives[1].kind == directive_kind::literal);
    REQUIRE(p.directives[1].aux == " ");

    REQUIRE(p.directives[2].kind == directive_kind::level);
    REQUIRE(p.directives[2].width == 5);
    REQUIRE(p.directives[2].left_align);

    REQUIRE(p.directives[3].aux == " ");
    REQUIRE(p.directives[4].kind == directive_kind::literal);
    REQUIRE(p.directives[4].aux == "-");
    REQUIRE(p.directives[5].aux == " ");
    REQUIRE(p.directives[6].kind == directive_kind::message);

    REQUIRE_FALSE(p.needs_file);
    REQUIRE_FALSE(p.needs_line);
}

TEST_CASE("Pattern flags and values", "[pattern]")
{
    SECTION("Flags without values")
    {
        auto p = compile_pattern("%level %message");
        REQUIRE(p.directives.size() == 3);
        REQUIRE(p.directives[0].kind == directive_kind::level);
        REQUIRE(p.directives[0].width == 0);
        REQUIRE(p.directives[1].aux == " ");
        REQUIRE(p.directives[2].kind == directive_kind::message);
    }

    SECTION("Literal text around flags")
    {
        auto p = compile_pattern("[%level] %message");
        REQUIRE(p.directives.size() == 4);
        REQUIRE(p.directives[0].aux == "[");
        REQUIRE(p.directives[1].kind == directive_kind::level);
        REQUIRE(p.directives[2].aux == "] ");
        REQUIRE(p.directives[3].kind == directive_kind::message);
    }

    SECTION("Right aligned padding")
    {
        auto p = compile_pattern("%level:8");
        REQUIRE(p.directives.size() == 1);
        REQUIRE(p.directives[0].width == 8);
        REQUIRE_FALSE(p.directives[0].left_align);
    }

    SECTION("Time without a value uses the default layout")
    {
        auto p = compile_pattern("%time %message");
        REQUIRE(p.directives[0].aux == DEFAULT_TIME_LAYOUT);
    }

    SECTION("UTC time")
    {
        auto p = compile_pattern("%utctime:15:04:05 %message");
        REQUIRE(p.directives[0].kind == directive_kind::utc_time);
        REQUIRE(p.directives[0].aux == "15:04:05");
    }

    SECTION("Escaped marker")
    {
        auto p = compile_pattern("100%% %message");
        REQUIRE(p.directives.size() == 2);
        REQUIRE(p.directives[0].aux == "100% ");
    }

    SECTION("Custom text keeps inner spaces")
    {
        auto p = compile_pattern("%custom:app one | %message");
        REQUIRE(p.directives[0].kind == directive_kind::literal);
        REQUIRE(p.directives[0].aux == "app one |");
        REQUIRE(p.directives[1].aux == " ");
    }

    SECTION("Empty custom value emits nothing")
    {
        auto p = compile_pattern("%custom %message");
        REQUIRE(p.directives.size() == 2);
        REQUIRE(p.directives[0].aux == " ");
    }
}

TEST_CASE("Pattern source location requirements", "[pattern]")
{
    REQUIRE(compile_pattern("%shortfile %message").needs_file);
    REQUIRE(compile_pattern("%longfile %message").needs_file);
    REQUIRE_FALSE(compile_pattern("%line %message").needs_file);
    REQUIRE(compile_pattern("%line %message").needs_line);

    auto p = compile_pattern("%shortfile:-12 %line:-4 %message");
    REQUIRE(p.needs_file);
    REQUIRE(p.needs_line);
    REQUIRE(p.directives[0].width == 12);
    REQUIRE(p.directives[2].width == 4);
}

TEST_CASE("Pattern compilation errors", "[pattern][errors]")
{
    SECTION("Empty pattern")
    {
        REQUIRE(compile_error("") == log_errc::empty_pattern);
        REQUIRE_THROWS_WITH(compile_pattern(""), Catch::Matchers::ContainsSubstring("log format string is empty"));
    }

    SECTION("Unknown flag")
    {
        REQUIRE(compile_error("%level %bogus %message") == log_errc::unrecognized_flag);
        REQUIRE_THROWS_WITH(compile_pattern("%bogus"), Catch::Matchers::ContainsSubstring("bogus"));
    }

    SECTION("Marker with no name")
    {
        REQUIRE(compile_error("%level %") == log_errc::unrecognized_flag);
    }

    SECTION("Bad padding")
    {
        REQUIRE(compile_error("%level:abc") == log_errc::invalid_flag_value);
        REQUIRE(compile_error("%line:-") == log_errc::invalid_flag_value);
        REQUIRE(compile_error("%message:99999999") == log_errc::invalid_flag_value);
    }
}

TEST_CASE("Shared compiled pattern", "[pattern]")
{
    auto p = make_pattern("%level %message");
    REQUIRE(p);
    REQUIRE(p->directives.size() == 3);
    REQUIRE_THROWS_AS(make_pattern(""), config_error);
}
