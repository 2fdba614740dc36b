/**
 * @file log_entry_pool.hpp
 * @brief Pool recycling log entries between logging calls
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include "moodycamel/concurrentqueue.h"
#include <memory>
#include <atomic>
#include <cstddef>
#include <cstdint>

#include "log_types.hpp"
#include "log_entry.hpp"

namespace rotalog
{

class entry_pool;

/**
 * @brief Deleter handing an entry back to its pool
 */
struct entry_releaser
{
    entry_pool *pool_{nullptr};
    void operator()(entry *e) const noexcept;
};

/// Owning handle to a pooled entry, released to the pool on destruction
using entry_ptr = std::unique_ptr<entry, entry_releaser>;

/**
 * @brief Free list of reusable entries
 *
 * Entries live on the heap and are recycled through a lock-free queue, so
 * under steady load a logging call allocates nothing. When the free list is
 * empty a new entry is allocated; when more than max_free entries are cached
 * a released entry is deleted instead. Synchronisation is independent of any
 * receiver.
 */
class entry_pool
{
  public:
    struct stats
    {
        uint64_t total_acquires; ///< Total acquire operations
        uint64_t total_releases; ///< Total release operations
        uint64_t allocations;    ///< Entries created because the free list was empty
        size_t in_use;           ///< Entries currently checked out
        size_t cached;           ///< Approximate number of entries waiting in the free list
    };

  private:
    const size_t max_free_;

    moodycamel::ConcurrentQueue<entry *> available_entries_; ///< Free list
    std::atomic<size_t> cached_count_{0};

    std::atomic<uint64_t> total_acquires_{0};
    std::atomic<uint64_t> total_releases_{0};
    std::atomic<uint64_t> allocations_{0};
    std::atomic<size_t> in_use_count_{0};

  public:
    /**
     * @brief Construct a pool
     * @param preallocate Entries created up front
     * @param max_free Upper bound on cached entries
     */
    explicit entry_pool(size_t preallocate = 0, size_t max_free = ENTRY_POOL_MAX_FREE)
        : max_free_(max_free)
        , available_entries_(preallocate > 0 ? preallocate : 32)
    {
        for (size_t i = 0; i < preallocate && i < max_free_; ++i)
        {
            available_entries_.enqueue(new entry());
            cached_count_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    ~entry_pool()
    {
        entry *e = nullptr;
        while (available_entries_.try_dequeue(e)) { delete e; }
    }

    // Non-copyable, non-movable
    entry_pool(const entry_pool &)            = delete;
    entry_pool &operator=(const entry_pool &) = delete;
    entry_pool(entry_pool &&)                 = delete;
    entry_pool &operator=(entry_pool &&)      = delete;

    /**
     * @brief Process-wide pool used by loggers unless given their own
     */
    static entry_pool &instance()
    {
        static entry_pool pool(ENTRY_POOL_PREALLOCATE);
        return pool;
    }

    /**
     * @brief Get a zero-valued entry
     *
     * The entry belongs to the caller until the handle is destroyed.
     */
    entry_ptr acquire()
    {
        entry *e = nullptr;
        if (available_entries_.try_dequeue(e)) { cached_count_.fetch_sub(1, std::memory_order_relaxed); }
        else
        {
            e = new entry();
            allocations_.fetch_add(1, std::memory_order_relaxed);
        }

        total_acquires_.fetch_add(1, std::memory_order_relaxed);
        in_use_count_.fetch_add(1, std::memory_order_relaxed);
        return entry_ptr(e, entry_releaser{this});
    }

    /**
     * @brief Reset an entry and put it back on the free list
     *
     * Usually called by entry_ptr's deleter. The entry must not be used afterwards.
     */
    void release(entry *e) noexcept
    {
        if (!e) return;

        e->reset();
        total_releases_.fetch_add(1, std::memory_order_relaxed);
        in_use_count_.fetch_sub(1, std::memory_order_relaxed);

        if (cached_count_.fetch_add(1, std::memory_order_relaxed) >= max_free_ || !available_entries_.enqueue(e))
        {
            cached_count_.fetch_sub(1, std::memory_order_relaxed);
            delete e;
        }
    }

    /**
     * @brief Get pool statistics
     * @return Current statistics snapshot
     */
    stats get_stats() const
    {
        stats s;
        s.total_acquires = total_acquires_.load(std::memory_order_relaxed);
        s.total_releases = total_releases_.load(std::memory_order_relaxed);
        s.allocations    = allocations_.load(std::memory_order_relaxed);
        s.in_use         = in_use_count_.load(std::memory_order_relaxed);
        s.cached         = cached_count_.load(std::memory_order_relaxed);
        return s;
    }

    size_t max_free() const noexcept { return max_free_; }
};

inline void entry_releaser::operator()(entry *e) const noexcept
{
    if (pool_) { pool_->release(e); }
    else { delete e; }
}

} // namespace rotalog
