/**
 * @file rotation_demo.cpp
 * @brief Demonstration of file rotation functionality
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This demo showcases the rotation modes:
 * - Size-based rotation
 * - Line-count rotation
 * - Daily rotation, driven by a simulated clock
 * - Multi-threaded logging into a rotating file
 */

#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <filesystem>
#include <atomic>
#include <memory>

#include "rotalog.hpp"

using namespace rotalog;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

const std::string log_dir = "/tmp/rotation_demo";

void print_header(const std::string &title)
{
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << " " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void print_stats(const logger &log)
{
    auto stats = log.get_stats();
    std::cout << "  Lines written: " << stats.lines_written << "\n";
    std::cout << "  Bytes written: " << stats.bytes_written << "\n";
}

void count_rotated_files(const std::string &base_path)
{
    fs::path base(base_path);
    fs::path dir = base.parent_path();
    if (dir.empty()) dir = ".";
    std::string stem = base.stem().string();

    size_t count      = 0;
    size_t total_size = 0;

    for (const auto &entry : fs::directory_iterator(dir))
    {
        if (entry.is_regular_file())
        {
            std::string filename = entry.path().filename().string();
            if (filename.find(stem + "-") == 0)
            {
                count++;
                total_size += entry.file_size();
            }
        }
    }

    std::cout << "  Rotated files: " << count << " (total size: " << total_size / 1024 << " KB)\n";
}

// Demo 1: Size-based rotation through the configuration string
void demo_size_rotation()
{
    print_header("Demo 1: Size-Based Rotation");

    std::string log_file = log_dir + "/size_rotation.log";

    auto log = make_logger(fmt::format(R"(
        receiver = "FILE"
        level = "DEBUG"
        file = "{}"
        rotate {{
            mode = "size"
            size = 1
        }}
    )",
                                       log_file));

    std::cout << "Configuration:\n";
    std::cout << "  Max file size: 1 MB\n";
    std::cout << "  Log directory: " << log_dir << "\n\n";

    std::cout << "Generating logs to trigger rotation...\n";
    for (int i = 0; i < 20000; ++i)
    {
        if (auto ec = log->infof("Size rotation test message {} - Lorem ipsum dolor sit amet, consectetur "
                                 "adipiscing elit, sed do eiusmod tempor incididunt ut labore",
                                 i))
        {
            std::cerr << "write failed: " << ec.message() << "\n";
            return;
        }

        if (i % 5000 == 0) { std::cout << "  Generated " << i << " messages\n"; }
    }

    count_rotated_files(log_file);
    print_stats(*log);
}

// Demo 2: Line-count rotation with a custom pattern
void demo_line_rotation()
{
    print_header("Demo 2: Line-Count Rotation");

    std::string log_file = log_dir + "/line_rotation.log";

    auto pattern = make_pattern("%utctime:2006-01-02T15:04:05.000Z07:00 %level:-5 %shortfile %line %message");
    rotate_policy policy;
    policy.mode      = rotate_policy::kind::lines;
    policy.max_lines = 250;

    logger log(log_level::trace, pattern, make_file_receiver(pattern, log_file, policy));

    std::cout << "Configuration:\n";
    std::cout << "  Lines per file: 250\n\n";

    for (int i = 0; i < 1000; ++i)
    {
        std::error_code ec;
        switch (i % 4)
        {
        case 0: ec = log.trace("tick ", i); break;
        case 1: ec = log.debug("value ", i, i * 2); break;
        case 2: ec = log.info("request ", i, " served"); break;
        default: ec = log.warnf("slow request {} took {} ms", i, i % 97); break;
        }
        if (ec)
        {
            std::cerr << "write failed: " << ec.message() << "\n";
            return;
        }
    }

    count_rotated_files(log_file);
    print_stats(log);
}

// Demo 3: Daily rotation, the clock jumps one day at a time
void demo_daily_rotation()
{
    print_header("Demo 3: Daily Rotation (Simulated Clock)");

    std::string log_file = log_dir + "/daily_rotation.log";

    auto simulated = std::make_shared<std::atomic<std::chrono::system_clock::rep>>(
        std::chrono::system_clock::now().time_since_epoch().count());
    time_source clock = [simulated]()
    { return std::chrono::system_clock::time_point(std::chrono::system_clock::duration(simulated->load())); };

    auto pattern = make_pattern(DEFAULT_PATTERN);
    rotate_policy policy;
    policy.mode = rotate_policy::kind::daily;

    logger log(log_level::info, pattern, make_file_receiver(pattern, log_file, policy, clock));

    for (int day = 0; day < 3; ++day)
    {
        for (int i = 0; i < 10; ++i)
        {
            if (auto ec = log.infof("day {} entry {}", day, i))
            {
                std::cerr << "write failed: " << ec.message() << "\n";
                return;
            }
        }
        simulated->fetch_add(std::chrono::duration_cast<std::chrono::system_clock::duration>(24h).count());
        std::cout << "  Advanced clock by one day\n";
    }
    if (auto ec = log.info("first entry of the final day")) { std::cerr << "write failed: " << ec.message() << "\n"; }

    count_rotated_files(log_file);
    print_stats(log);
}

// Demo 4: Multiple threads share one rotating logger
void demo_multithreaded()
{
    print_header("Demo 4: Multi-Threaded Logging");

    std::string log_file = log_dir + "/mt_rotation.log";
    auto log             = make_logger(fmt::format("receiver = FILE\nfile = \"{}\"\nrotate.mode = lines\nrotate.lines = 5000\n",
                                                   log_file));

    std::atomic<uint64_t> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back(
            [&, t]()
            {
                for (int i = 0; i < 5000; ++i)
                {
                    if (log->infof("Thread-{} msg#{}", t, i)) failures.fetch_add(1);
                }
            });
    }
    for (auto &th : threads) { th.join(); }

    count_rotated_files(log_file);
    print_stats(*log);
    std::cout << "  Failed writes: " << failures.load() << "\n";
}

int main()
{
    std::cout << "rotalog " << VERSION << " rotation demo\n";

    try
    {
        fs::create_directories(log_dir);

        demo_size_rotation();
        demo_line_rotation();
        demo_daily_rotation();
        demo_multithreaded();
    }
    catch (const config_error &e)
    {
        std::cerr << "configuration error: " << e.what() << "\n";
        return 1;
    }
    catch (const fs::filesystem_error &e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "\nLog files are in " << log_dir << "\n";
    return 0;
}
