/**
 * @file test_rotation.cpp
 * @brief Test suite for daily, size and line based file rotation
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <regex>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "log_receivers.hpp"
#include "log_file_rotator.hpp"

using namespace rotalog;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class rotation_test_fixture
{
  protected:
    std::string test_dir;
    std::string base_filename;

    // Controllable clock shared with the writer under test
    std::shared_ptr<std::chrono::system_clock::time_point> clock_now;
    time_source clock;

    rotation_test_fixture()
    {
        auto pid = getpid();
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        test_dir = "/tmp/test_rotation_" + std::to_string(pid) + "_" + std::to_string(tid);
        fs::create_directories(test_dir);
        base_filename = test_dir + "/app.log";

        clock_now = std::make_shared<std::chrono::system_clock::time_point>(local_time(2016, 7, 3, 12, 0, 0));
        clock     = [now = clock_now]() { return *now; };
    }

    ~rotation_test_fixture()
    {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    static std::chrono::system_clock::time_point local_time(int year, int mon, int day, int hour, int min, int sec)
    {
        std::tm tm{};
        tm.tm_year  = year - 1900;
        tm.tm_mon   = mon - 1;
        tm.tm_mday  = day;
        tm.tm_hour  = hour;
        tm.tm_min   = min;
        tm.tm_sec   = sec;
        tm.tm_isdst = -1;
        return std::chrono::system_clock::from_time_t(std::mktime(&tm));
    }

    std::vector<std::string> rotated_files()
    {
        std::vector<std::string> result;
        std::regex pattern(R"(app-\d{4}-\d{2}-\d{2}-\d{2}-\d{2}-\d{2}\.\d{3}(-\d+)?\.log)");
        for (const auto &entry : fs::directory_iterator(test_dir))
        {
            if (!entry.is_regular_file()) continue;
            std::string filename = entry.path().filename().string();
            if (std::regex_match(filename, pattern)) { result.push_back(filename); }
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    size_t get_file_size(const std::string &path)
    {
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        return ec ? 0 : static_cast<size_t>(size);
    }

    static std::error_code write_line(file_receiver &recv, std::string_view text)
    {
        entry e;
        e.level_            = log_level::info;
        e.timestamp_        = std::chrono::system_clock::now();
        e.message_template_ = std::string(text);
        return recv.output(e);
    }

    static uint64_t rotations(const file_receiver &recv)
    {
        return recv.with_writer([](const rotating_file_writer &w) { return w.rotations(); });
    }
};

TEST_CASE_METHOD(rotation_test_fixture, "Size-based rotation", "[rotation][size]")
{
    rotate_policy policy;
    policy.mode      = rotate_policy::kind::size;
    policy.max_bytes = 100;

    const std::string line(29, 'A'); // 30 bytes with the newline

    SECTION("Rotation before the limit would be exceeded")
    {
        auto recv = make_file_receiver(make_pattern("%message"), base_filename, policy, clock);

        for (int i = 0; i < 3; ++i) { REQUIRE_FALSE(write_line(*recv, line)); }
        REQUIRE(rotated_files().empty());
        REQUIRE(get_file_size(base_filename) == 90);

        REQUIRE_FALSE(write_line(*recv, line));
        auto files = rotated_files();
        REQUIRE(files.size() == 1);
        REQUIRE(get_file_size(test_dir + "/" + files[0]) == 90);
        REQUIRE(get_file_size(base_filename) == 30);
    }

    SECTION("Multiple rotations at the same instant get distinct names")
    {
        auto recv = make_file_receiver(make_pattern("%message"), base_filename, policy, clock);

        for (int i = 0; i < 10; ++i) { REQUIRE_FALSE(write_line(*recv, line)); }

        auto files = rotated_files();
        REQUIRE(files.size() == 3);
        REQUIRE(rotations(*recv) == 3);
        REQUIRE(files[0] == "app-2016-07-03-12-00-00.000-1.log");
        REQUIRE(files[1] == "app-2016-07-03-12-00-00.000-2.log");
        REQUIRE(files[2] == "app-2016-07-03-12-00-00.000.log");
        REQUIRE(get_file_size(base_filename) == 30);
    }

    SECTION("Existing file size counts towards the limit")
    {
        {
            std::ofstream out(base_filename);
            out << std::string(94, 'B') << '\n';
        }
        auto recv = make_file_receiver(make_pattern("%message"), base_filename, policy, clock);
        REQUIRE_FALSE(write_line(*recv, line));

        REQUIRE(rotated_files().size() == 1);
        REQUIRE(get_file_size(base_filename) == 30);
    }

    SECTION("Oversized line goes to an empty file")
    {
        auto recv = make_file_receiver(make_pattern("%message"), base_filename, policy, clock);
        REQUIRE_FALSE(write_line(*recv, std::string(250, 'C')));

        REQUIRE(rotated_files().empty());
        REQUIRE(get_file_size(base_filename) == 251);
    }
}

TEST_CASE_METHOD(rotation_test_fixture, "Line-based rotation", "[rotation][lines]")
{
    rotate_policy policy;
    policy.mode      = rotate_policy::kind::lines;
    policy.max_lines = 5;

    SECTION("Rotates after the configured number of lines")
    {
        auto recv = make_file_receiver(make_pattern("%message"), base_filename, policy, clock);

        for (int i = 0; i < 12; ++i) { REQUIRE_FALSE(write_line(*recv, fmt::format("line {}", i))); }

        REQUIRE(rotated_files().size() == 2);
        REQUIRE(recv->with_writer([](const rotating_file_writer &w) { return w.current_lines(); }) == 2);

        std::ifstream in(base_filename);
        std::string first;
        std::getline(in, first);
        REQUIRE(first == "line 10");
    }

    SECTION("Zero lines never rotates")
    {
        policy.max_lines = 0;
        auto recv        = make_file_receiver(make_pattern("%message"), base_filename, policy, clock);

        for (int i = 0; i < 20; ++i) { REQUIRE_FALSE(write_line(*recv, "x")); }
        REQUIRE(rotated_files().empty());
    }
}

TEST_CASE_METHOD(rotation_test_fixture, "Daily rotation", "[rotation][daily]")
{
    rotate_policy policy;
    policy.mode = rotate_policy::kind::daily;

    auto recv = make_file_receiver(make_pattern("%message"), base_filename, policy, clock);
    REQUIRE_FALSE(write_line(*recv, "sunday"));

    SECTION("Same day keeps the file")
    {
        *clock_now += 11h;
        REQUIRE_FALSE(write_line(*recv, "sunday night"));
        REQUIRE(rotated_files().empty());
    }

    SECTION("Day change rotates before the write")
    {
        *clock_now = local_time(2016, 7, 4, 0, 0, 1);
        REQUIRE_FALSE(write_line(*recv, "monday"));

        auto files = rotated_files();
        REQUIRE(files.size() == 1);
        REQUIRE(files[0] == "app-2016-07-04-00-00-01.000.log");

        std::ifstream backup(test_dir + "/" + files[0]);
        std::string content;
        std::getline(backup, content);
        REQUIRE(content == "sunday");

        std::ifstream current(base_filename);
        std::getline(current, content);
        REQUIRE(content == "monday");

        // Only one rotation per day
        *clock_now += 1h;
        REQUIRE_FALSE(write_line(*recv, "monday later"));
        REQUIRE(rotated_files().size() == 1);
    }
}

TEST_CASE_METHOD(rotation_test_fixture, "Rotation keeps receiver statistics", "[rotation][stats]")
{
    rotate_policy policy;
    policy.mode      = rotate_policy::kind::lines;
    policy.max_lines = 3;

    auto recv = make_file_receiver(make_pattern("%message"), base_filename, policy, clock);
    for (int i = 0; i < 10; ++i) { REQUIRE_FALSE(write_line(*recv, "12345")); }

    auto stats = recv->get_stats();
    REQUIRE(stats.lines_written == 10);
    REQUIRE(stats.bytes_written == 60);
    REQUIRE(rotations(*recv) == 3);
}

TEST_CASE_METHOD(rotation_test_fixture, "No rotation mode", "[rotation]")
{
    rotate_policy policy;
    policy.mode      = rotate_policy::kind::none;
    policy.max_bytes = 10;
    policy.max_lines = 1;

    auto recv = make_file_receiver(make_pattern("%message"), base_filename, policy, clock);
    for (int i = 0; i < 5; ++i) { REQUIRE_FALSE(write_line(*recv, "no rotation here")); }
    REQUIRE(rotated_files().empty());
}

TEST_CASE_METHOD(rotation_test_fixture, "Failed rotation keeps writing to the current file", "[rotation][errors]")
{
    // Take every backup name available at the fixture's instant
    auto block_backup_names = [&]()
    {
        for (;;)
        {
            auto name = rotating_file_writer::generate_rotated_filename(base_filename, *clock_now);
            if (name.empty()) break;
            std::ofstream out(name);
            out << "taken";
        }
    };
    auto release_backup_names = [&]()
    {
        for (const auto &name : rotated_files()) { fs::remove(test_dir + "/" + name); }
    };
    auto current_lines = [](const file_receiver &recv)
    { return recv.with_writer([](const rotating_file_writer &w) { return w.current_lines(); }); };

    SECTION("Size mode")
    {
        rotate_policy policy;
        policy.mode      = rotate_policy::kind::size;
        policy.max_bytes = 100;
        const std::string line(29, 'B'); // 30 bytes with the newline

        auto recv = make_file_receiver(make_pattern("%message"), base_filename, policy, clock);
        for (int i = 0; i < 3; ++i) { REQUIRE_FALSE(write_line(*recv, line)); }

        block_backup_names();
        REQUIRE(write_line(*recv, line) == std::errc::file_exists);
        REQUIRE(get_file_size(base_filename) == 120);
        REQUIRE(recv->get_stats().lines_written == 4);
        REQUIRE(rotations(*recv) == 0);

        // The next attempt waits for another full threshold
        REQUIRE_FALSE(write_line(*recv, line));
        REQUIRE_FALSE(write_line(*recv, line));
        REQUIRE(get_file_size(base_filename) == 180);

        release_backup_names();
        REQUIRE_FALSE(write_line(*recv, line));
        REQUIRE(rotations(*recv) == 1);
        REQUIRE(rotated_files().size() == 1);
        REQUIRE(get_file_size(test_dir + "/" + rotated_files()[0]) == 180);
        REQUIRE(get_file_size(base_filename) == 30);
        REQUIRE(recv->get_stats().lines_written == 7);
    }

    SECTION("Lines mode keeps counting the unrotated file")
    {
        rotate_policy policy;
        policy.mode      = rotate_policy::kind::lines;
        policy.max_lines = 2;

        auto recv = make_file_receiver(make_pattern("%message"), base_filename, policy, clock);
        REQUIRE_FALSE(write_line(*recv, "one"));
        REQUIRE_FALSE(write_line(*recv, "two"));

        block_backup_names();
        REQUIRE(write_line(*recv, "three") == std::errc::file_exists);
        REQUIRE(current_lines(*recv) == 3);
        REQUIRE_FALSE(write_line(*recv, "four"));
        REQUIRE(write_line(*recv, "five") == std::errc::file_exists);
        REQUIRE(current_lines(*recv) == 5);

        release_backup_names();
        REQUIRE_FALSE(write_line(*recv, "six"));
        REQUIRE(rotations(*recv) == 0);
        REQUIRE_FALSE(write_line(*recv, "seven"));
        REQUIRE(rotations(*recv) == 1);
        REQUIRE(current_lines(*recv) == 1);
        REQUIRE(recv->get_stats().lines_written == 7);
    }
}

TEST_CASE("Rotation policy names", "[rotation]")
{
    REQUIRE(rotate_policy::mode_from_string("daily") == rotate_policy::kind::daily);
    REQUIRE(rotate_policy::mode_from_string("size") == rotate_policy::kind::size);
    REQUIRE(rotate_policy::mode_from_string("lines") == rotate_policy::kind::lines);
    REQUIRE(rotate_policy::mode_from_string("hourly") == rotate_policy::kind::none);
}

TEST_CASE_METHOD(rotation_test_fixture, "Rotated file names", "[rotation][naming]")
{
    auto when = local_time(2016, 7, 3, 19, 22, 11) + 504ms;

    SECTION("Directory, stem and extension are kept")
    {
        auto name = rotating_file_writer::generate_rotated_filename(base_filename, when);
        REQUIRE(name == test_dir + "/app-2016-07-03-19-22-11.504.log");
    }

    SECTION("Name without extension")
    {
        auto name = rotating_file_writer::generate_rotated_filename(test_dir + "/server", when);
        REQUIRE(name == test_dir + "/server-2016-07-03-19-22-11.504");
    }

    SECTION("Taken names get a sequence number")
    {
        {
            std::ofstream out(test_dir + "/app-2016-07-03-19-22-11.504.log");
        }
        auto name = rotating_file_writer::generate_rotated_filename(base_filename, when);
        REQUIRE(name == test_dir + "/app-2016-07-03-19-22-11.504-1.log");
    }
}
