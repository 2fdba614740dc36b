/**
 * @file log_receiver.hpp
 * @brief Receiver interface and its generic implementation
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <new>
#include <system_error>
#include <utility>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"
#include "log_errors.hpp"
#include "log_entry.hpp"
#include "log_stats.hpp"
#include "log_formatters.hpp"

namespace rotalog
{

/**
 * @brief Abstract interface for log receivers
 *
 * A receiver owns a sink, renders entries into it and enforces its own
 * lifecycle (closing, rotation). The concrete receiver is chosen once when
 * the logger is built.
 */
class receiver
{
  public:
    virtual ~receiver() = default;

    /**
     * @brief Render and write one entry
     * @return Empty on success, log_errc::writer_closed after close(), or the write error.
     *         A failed file rotation is returned even though the line was written.
     */
    virtual std::error_code output(const entry &e) = 0;

    /// Close the sink; idempotent
    virtual void close() = 0;

    virtual bool is_closed() const noexcept = 0;

    virtual receiver_stats::snapshot get_stats() const noexcept = 0;
};

/**
 * @brief Receiver combining a pattern_formatter with a writer policy
 *
 * One mutex serialises output(), the writer's rotation check and close(), so
 * a rotation decision can't go stale between check and write and lines never
 * interleave. Rendering reuses a single buffer owned by the receiver.
 *
 * @tparam Writer Sink policy, see log_writers.hpp
 */
template <typename Writer> class basic_receiver final : public receiver
{
  public:
    template <typename... WriterArgs>
    explicit basic_receiver(pattern_formatter formatter, WriterArgs &&...writer_args)
        : formatter_(std::move(formatter))
        , writer_(std::forward<WriterArgs>(writer_args)...)
    {
        buffer_.reserve(RECEIVER_BUFFER_RESERVE);
    }

    ~basic_receiver() override { close(); }

    std::error_code output(const entry &e) override
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (closed_.load(std::memory_order_relaxed)) { return make_error_code(log_errc::writer_closed); }

        buffer_.clear();
        size_t semantic_bytes = 0;
        try
        {
            semantic_bytes = formatter_.format(e, buffer_);
        }
        catch (const fmt::format_error &)
        {
            return make_error_code(log_errc::format_failed);
        }
        catch (const std::bad_alloc &)
        {
            return std::make_error_code(std::errc::not_enough_memory);
        }

        // A failed rotation leaves the writer on its current file; the line
        // still goes there and the rotation error is reported after the write
        std::error_code rotate_ec = writer_.prepare(buffer_.size());
        if (rotate_ec && !writer_.is_open()) return rotate_ec;
        if (auto ec = writer_.write(buffer_.data(), buffer_.size())) return ec;

        stats_.record(semantic_bytes);
        return rotate_ec;
    }

    void close() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.load(std::memory_order_relaxed)) return;

        writer_.close();
        closed_.store(true, std::memory_order_release);
    }

    bool is_closed() const noexcept override { return closed_.load(std::memory_order_acquire); }

    receiver_stats::snapshot get_stats() const noexcept override { return stats_.get(); }

    const pattern_formatter &formatter() const noexcept { return formatter_; }

    /**
     * @brief Run a function against the writer under the receiver's lock
     */
    template <typename Fn> decltype(auto) with_writer(Fn &&fn) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::forward<Fn>(fn)(writer_);
    }

  private:
    mutable std::mutex mutex_;
    pattern_formatter formatter_;
    Writer writer_;
    fmt::memory_buffer buffer_;
    receiver_stats stats_;
    std::atomic<bool> closed_{false};
};

} // namespace rotalog
