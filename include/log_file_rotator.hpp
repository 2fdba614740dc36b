/**
 * @file log_file_rotator.hpp
 * @brief File rotation support for log files
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This file provides the rotating file sink used by the file receiver:
 * - Daily rotation (calendar day change, local time)
 * - Size-based rotation (rotate before a write would exceed the limit)
 * - Line-count rotation (rotate after N lines in the current file)
 *
 * Rotation closes the current file, renames it to
 * `stem-YYYY-MM-DD-HH-MM-SS.mmm.ext` (local time) and opens a fresh file at
 * the original path. Everything happens synchronously inside the write call
 * that detected the need to rotate, under the owning receiver's lock.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#endif

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"
#include "log_errors.hpp"
#include "log_writers.hpp"

namespace rotalog
{

/**
 * @brief Rotation policy configuration
 */
struct rotate_policy
{
    /**
     * @brief Rotation trigger mode
     */
    enum class kind
    {
        none,  ///< Single file, never rotated
        daily, ///< Rotate when the calendar day changes
        size,  ///< Rotate before the file would exceed max_bytes
        lines  ///< Rotate after max_lines lines
    };
    kind mode = kind::none; ///< Active rotation mode

    uint64_t max_bytes = 0; ///< Size limit for kind::size
    uint64_t max_lines = 0; ///< Line limit for kind::lines (0 = never rotate)

    /**
     * @brief Parse a rotate.mode value; unrecognised names mean no rotation
     */
    static kind mode_from_string(std::string_view name)
    {
        if (name == "daily") return kind::daily;
        if (name == "size") return kind::size;
        if (name == "lines") return kind::lines;
        return kind::none;
    }
};

/**
 * @brief File sink with daily, size and line rotation
 *
 * Not thread-safe on its own; basic_receiver serialises all calls.
 */
class rotating_file_writer
{
  public:
    /**
     * @brief Open (or create) the log file
     * @param filename Path to the log file, parent directories are created
     * @param policy Rotation policy to apply
     * @param now Clock consulted for daily rotation and backup names
     * @throws config_error if the file cannot be opened
     */
    explicit rotating_file_writer(std::string filename, rotate_policy policy = {}, time_source now = system_time_source)
        : filename_(std::move(filename))
        , policy_(policy)
        , now_(now ? std::move(now) : time_source(system_time_source))
    {
        if (auto ec = open_file())
        {
            throw config_error(ec, fmt::format("Failed to open log file: {}", filename_));
        }
        open_day_ = local_day(now_());
    }

    rotating_file_writer(const rotating_file_writer &)            = delete;
    rotating_file_writer &operator=(const rotating_file_writer &) = delete;

    ~rotating_file_writer() { close(); }

    /**
     * @brief Rotate now if the policy says the next write must go to a fresh file
     * @param next_write_size Size of the pending write in bytes
     * @return The rotation error, if any. The pending line can still be
     *         written when is_open() is true afterwards.
     */
    std::error_code prepare(size_t next_write_size)
    {
        if (fd_ < 0)
        {
            // A previous rotation could not reopen the file
            if (auto ec = open_file()) return ec;
        }

        if (should_rotate(next_write_size)) { return rotate(); }
        return {};
    }

    bool is_open() const noexcept { return fd_ >= 0; }

    std::error_code write(const char *data, size_t len)
    {
        if (auto ec = detail::write_all(fd_, data, len)) return ec;

        current_size_ += len;
        ++current_lines_;
        return {};
    }

    void close()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    /**
     * @brief Check if rotation is needed
     * @param next_write_size Size of the next write in bytes
     */
    bool should_rotate(size_t next_write_size) const
    {
        switch (policy_.mode)
        {
        case rotate_policy::kind::daily: return local_day(now_()) != open_day_;
        case rotate_policy::kind::size:
            return current_size_ > size_base_ && current_size_ - size_base_ + next_write_size > policy_.max_bytes;
        case rotate_policy::kind::lines:
            return policy_.max_lines > 0 && current_lines_ - lines_base_ >= policy_.max_lines;
        default: return false;
        }
    }

    /**
     * @brief Archive the current file and start a new one
     *
     * When no backup name is free or the rename fails, the original file is
     * reopened and stays current. The next attempt is postponed until the
     * policy threshold is reached once more, counted from the failure point,
     * and the error is returned.
     */
    std::error_code rotate()
    {
        close();

        std::error_code ec;
        std::string rotated = generate_rotated_filename(filename_, now_());
        if (rotated.empty()) { ec = std::make_error_code(std::errc::file_exists); }
        else if (::rename(filename_.c_str(), rotated.c_str()) != 0) { ec = {errno, std::system_category()}; }

        if (ec)
        {
            if (auto reopen_ec = open_file()) return reopen_ec;
            size_base_  = current_size_;
            lines_base_ = current_lines_;
            open_day_   = local_day(now_());
            return ec;
        }

        current_lines_         = 0;
        size_base_             = 0;
        lines_base_            = 0;
        open_day_              = local_day(now_());
        last_rotated_filename_ = std::move(rotated);
        ++rotations_;

        return open_file();
    }

    const std::string &filename() const noexcept { return filename_; }
    const rotate_policy &policy() const noexcept { return policy_; }
    uint64_t current_size() const noexcept { return current_size_; }
    uint64_t current_lines() const noexcept { return current_lines_; }
    uint64_t rotations() const noexcept { return rotations_; }
    const std::string &last_rotated_filename() const noexcept { return last_rotated_filename_; }

    /**
     * @brief Backup name for a rotated file
     *
     * Format: dir/stem-YYYY-MM-DD-HH-MM-SS.mmm.ext, with "-N" appended to the
     * timestamp when that name is already taken. Returns an empty string when
     * no free name was found.
     */
    static std::string generate_rotated_filename(const std::string &base, std::chrono::system_clock::time_point when)
    {
        namespace fs = std::filesystem;
        using namespace std::chrono;

        auto secs      = floor<seconds>(when.time_since_epoch());
        auto millis    = duration_cast<milliseconds>(when.time_since_epoch() - secs).count();
        std::time_t tt = static_cast<std::time_t>(secs.count());
        std::tm tm_local{};
        localtime_r(&tt, &tm_local);

        std::string timestamp = fmt::format("{:04}-{:02}-{:02}-{:02}-{:02}-{:02}.{:03}", tm_local.tm_year + 1900,
                                            tm_local.tm_mon + 1, tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                                            tm_local.tm_sec, millis);

        // Split base into directory, stem and extension
        fs::path base_path(base);
        fs::path dir     = base_path.parent_path();
        std::string stem = base_path.stem().string();
        std::string ext  = base_path.extension().string();

        for (int seq = 0; seq < ROTATION_MAX_NAME_ATTEMPTS; ++seq)
        {
            std::string name = seq == 0 ? fmt::format("{}-{}{}", stem, timestamp, ext)
                                        : fmt::format("{}-{}-{}{}", stem, timestamp, seq, ext);
            fs::path candidate = dir.empty() ? fs::path(name) : dir / name;

            struct stat st;
            if (::stat(candidate.c_str(), &st) != 0 && errno == ENOENT) { return candidate.string(); }
        }
        return {};
    }

    /**
     * @brief Calendar day of a point in time, in local time
     */
    static int local_day(std::chrono::system_clock::time_point tp)
    {
        std::time_t tt = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_local{};
        localtime_r(&tt, &tm_local);
        return (tm_local.tm_year + 1900) * 1000 + tm_local.tm_yday;
    }

  private:
    std::string filename_;
    rotate_policy policy_;
    time_source now_;

    int fd_{-1};
    uint64_t current_size_{0};  ///< Bytes in the current file
    uint64_t current_lines_{0}; ///< Lines written to the current file
    int open_day_{0};           ///< local_day() when the current file was opened
    uint64_t size_base_{0};     ///< current_size_ at the last failed rotation
    uint64_t lines_base_{0};    ///< current_lines_ at the last failed rotation
    uint64_t rotations_{0};
    std::string last_rotated_filename_;

    std::error_code open_file()
    {
        namespace fs = std::filesystem;

        fs::path parent = fs::path(filename_).parent_path();
        if (!parent.empty())
        {
            std::error_code dir_ec;
            fs::create_directories(parent, dir_ec);
            if (dir_ec) return dir_ec;
        }

        int fd = ::open(filename_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, LOG_FILE_MODE);
        if (fd < 0) { return {errno, std::system_category()}; }

        // Get the current file size to properly handle existing files
        struct stat st;
        current_size_ = (fstat(fd, &st) == 0) ? static_cast<uint64_t>(st.st_size) : 0;
        if (current_size_ < size_base_) size_base_ = 0;
        fd_ = fd;
        return {};
    }
};

} // namespace rotalog
