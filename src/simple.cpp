#include <iostream>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>
#include "rotalog.hpp"

using namespace rotalog;

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -r <receiver>     Receiver type: CONSOLE, FILE (default: CONSOLE)\n"
              << "  -l <level>        Level threshold: ERROR, WARN, INFO, DEBUG, TRACE (default: DEBUG)\n"
              << "  -p <pattern>      Output pattern (default: " << DEFAULT_PATTERN << ")\n"
              << "  -f <file>         Output file for FILE (default: /tmp/log.txt)\n"
              << "  -c <config>       Read the logger configuration from a file, other options are ignored\n"
              << "  -n                No colours on the console\n"
              << "  -h                Show this help\n";
}

int main(int argc, char *argv[])
{
    // Default parameters
    std::string receiver_type = "CONSOLE";
    std::string level         = "DEBUG";
    std::string pattern(DEFAULT_PATTERN);
    std::string output_file   = "/tmp/log.txt";
    std::string config_file;
    bool color = true;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-r") == 0 && i + 1 < argc) {
            receiver_type = argv[++i];
        } else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc) {
            level = argv[++i];
        } else if (strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            pattern = argv[++i];
        } else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            config_file = argv[++i];
        } else if (strcmp(argv[i], "-n") == 0) {
            color = false;
        } else if (strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::unique_ptr<logger> log;
    try {
        if (!config_file.empty()) {
            std::ifstream in(config_file);
            if (!in) {
                std::cerr << "Error: cannot read " << config_file << "\n";
                return 1;
            }
            std::stringstream ss;
            ss << in.rdbuf();
            log = make_logger(ss.str());
        } else {
            log_config cfg;
            cfg.set("receiver", receiver_type);
            cfg.set("level", level);
            cfg.set("pattern", pattern);
            cfg.set("file", output_file);
            cfg.set("color", color ? "true" : "false");
            log = make_logger(cfg);
        }
    } catch (const config_error &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    int failures = 0;
    auto check = [&failures](std::error_code ec) {
        if (ec) {
            std::cerr << "write failed: " << ec.message() << "\n";
            ++failures;
        }
    };

    for (int i = 0; i < 5; ++i) {
        check(log->info("Hello world ", i, " from main"));
    }

    check(log->error("Starting log test with receiver type: ", receiver_type));
    check(log->warnf("Level threshold is {}", string_from_log_level(log->level())));
    check(log->infof("{}, {}, & {}", "simple", "flexible", "powerful"));
    check(log->debugf("Output file: {}", output_file));
    check(log->trace("Values ", 1, 2, 3.5, " and a string"));
    check(log->infof("{:>8}|{:<8}|{:^8}|", "right", "left", "center"));

    auto stats = log->get_stats();
    std::cerr << "Lines written: " << stats.lines_written << ", bytes written: " << stats.bytes_written << "\n";

    log->close();
    return failures == 0 ? 0 : 1;
}
