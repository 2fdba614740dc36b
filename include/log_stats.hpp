/**
 * @file log_stats.hpp
 * @brief Per-receiver write counters
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace rotalog
{

/**
 * @brief Lines and bytes a receiver has written over its lifetime
 *
 * Counters are cumulative across file rotations. They are updated once per
 * successful write and can be read at any time without taking the
 * receiver's lock.
 */
class receiver_stats
{
  public:
    struct snapshot
    {
        uint64_t lines_written{0};
        uint64_t bytes_written{0};
    };

    void record(size_t bytes) noexcept
    {
        lines_written_.fetch_add(1, std::memory_order_relaxed);
        bytes_written_.fetch_add(bytes, std::memory_order_relaxed);
    }

    snapshot get() const noexcept
    {
        snapshot s;
        s.lines_written = lines_written_.load(std::memory_order_relaxed);
        s.bytes_written = bytes_written_.load(std::memory_order_relaxed);
        return s;
    }

    uint64_t lines_written() const noexcept { return lines_written_.load(std::memory_order_relaxed); }
    uint64_t bytes_written() const noexcept { return bytes_written_.load(std::memory_order_relaxed); }

  private:
    std::atomic<uint64_t> lines_written_{0};
    std::atomic<uint64_t> bytes_written_{0};
};

} // namespace rotalog
