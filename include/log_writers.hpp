/**
 * @file log_writers.hpp
 * @brief Log output writer implementations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A writer is the sink half of a receiver. basic_receiver drives it with:
 * @code
 * std::error_code prepare(size_t next_write_size); // before each write, may rotate
 * std::error_code write(const char *data, size_t len);
 * bool is_open() const noexcept;                    // false when prepare() left nothing to write to
 * void close();
 * @endcode
 * All calls are made under the owning receiver's lock.
 */
#pragma once

#include <cerrno>
#include <cstddef>
#include <system_error>
#include <unistd.h> // For write() and STDERR_FILENO

namespace rotalog
{

namespace detail
{

// Writes the whole buffer, retrying on EINTR and short writes
inline std::error_code write_all(int fd, const char *data, size_t len)
{
    if (fd < 0) { return std::make_error_code(std::errc::bad_file_descriptor); }

    size_t total_written = 0;
    while (total_written < len)
    {
        ssize_t written = ::write(fd, data + total_written, len - total_written);
        if (written < 0)
        {
            if (errno == EINTR) { continue; }
            return {errno, std::system_category()};
        }
        total_written += static_cast<size_t>(written);
    }
    return {};
}

} // namespace detail

/**
 * @brief Writes to an already open file descriptor
 *
 * Used by the console receiver with STDERR_FILENO. The descriptor is only
 * closed on close() when the writer owns it.
 */
class fd_writer
{
  public:
    explicit fd_writer(int fd = STDERR_FILENO, bool close_fd = false) : fd_(fd), close_fd_(close_fd) {}

    fd_writer(const fd_writer &)            = delete;
    fd_writer &operator=(const fd_writer &) = delete;

    ~fd_writer() { close(); }

    std::error_code prepare(size_t) { return {}; }

    std::error_code write(const char *data, size_t len) { return detail::write_all(fd_, data, len); }

    void close()
    {
        if (close_fd_ && fd_ >= 0) { ::close(fd_); }
        fd_ = -1;
    }

    bool is_open() const noexcept { return fd_ >= 0; }

    int fd() const noexcept { return fd_; }

  private:
    int fd_{-1};          ///< Output descriptor
    bool close_fd_{false}; ///< Whether to close fd on close/destruction
};

} // namespace rotalog
