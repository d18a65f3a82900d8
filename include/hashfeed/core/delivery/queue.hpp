/*
===============================================================================
 hashfeed::core::delivery::Queue
===============================================================================

Bounded, ordered hand-off from the broker I/O context (producers) to the
application (consumer).

-------------------------------------------------------------------------------
 Guarantees
-------------------------------------------------------------------------------
- Single global FIFO: messages are popped in push order, across all topics
- push() never blocks on the consumer; it holds the queue mutex only for a
  slot write
- Capacity is fixed at construction; overflow is resolved by OverflowPolicy
  and counted in dropped()
- Every admitted message gets a sequence number, strictly increasing in pop
  order

-------------------------------------------------------------------------------
 Cancellation
-------------------------------------------------------------------------------
close() is the end-of-stream signal:
- blocked pop() callers wake up
- pop() keeps returning buffered messages, then returns false
- push() after close() is refused

-------------------------------------------------------------------------------
 Threading
-------------------------------------------------------------------------------
Any number of producers and consumers may call in concurrently. Ordering
across consumers is only meaningful with a single consumer.
===============================================================================
*/
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

#include "hashfeed/core/delivery/message.hpp"
#include "hashfeed/core/delivery/overflow_policy.hpp"
#include "hashfeed/core/config/defaults.hpp"
#include "hashfeed/log/logger.hpp"


namespace hashfeed::core::delivery {

class Queue {
public:
    explicit Queue(std::size_t capacity = config::DELIVERY_QUEUE_CAPACITY,
                   OverflowPolicy policy = OverflowPolicy::DropOldest)
        : slots_(capacity == 0 ? 1 : capacity)
        , policy_(policy)
    {
    }

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    // -------------------------------------------------------------------------
    // Producer side
    // -------------------------------------------------------------------------

    // Returns true if `msg` was admitted. Under DropOldest a full queue still
    // admits the message (after evicting the oldest one).
    inline bool push(InboundMessage msg) {
        bool dropped_oldest = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            if (size_ == slots_.size()) {
                if (policy_ == OverflowPolicy::DropNewest) {
                    dropped_.fetch_add(1, std::memory_order_relaxed);
                    return false;
                }
                // Evict oldest
                head_ = next_(head_);
                --size_;
                dropped_oldest = true;
                dropped_.fetch_add(1, std::memory_order_relaxed);
            }
            msg.sequence = next_sequence_++;
            slots_[tail_()] = std::move(msg);
            ++size_;
            pushed_.fetch_add(1, std::memory_order_relaxed);
        }
        if (dropped_oldest) {
            HF_TRACE("[QUEUE] Full (capacity " << slots_.size() << ") - oldest message dropped");
        }
        not_empty_.notify_one();
        return true;
    }

    // -------------------------------------------------------------------------
    // Consumer side
    // -------------------------------------------------------------------------

    // Blocks until a message is available or the queue is closed and empty.
    [[nodiscard]]
    inline bool pop(InboundMessage& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return size_ > 0 || closed_; });
        return take_(out);
    }

    // As pop(), giving up after `timeout`.
    template<class Rep, class Period>
    [[nodiscard]]
    inline bool pop_for(InboundMessage& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return size_ > 0 || closed_; });
        return take_(out);
    }

    [[nodiscard]]
    inline bool try_pop(InboundMessage& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_(out);
    }

    // Consume everything currently buffered. Returns the number of messages.
    template<class F>
    inline std::size_t drain(F&& f) {
        std::size_t n = 0;
        InboundMessage msg;
        while (try_pop(msg)) {
            f(msg);
            ++n;
        }
        return n;
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    inline void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
        }
        HF_DEBUG("[QUEUE] Closed (" << size() << " message(s) left)");
        not_empty_.notify_all();
    }

    [[nodiscard]]
    inline bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // -------------------------------------------------------------------------
    // Observability
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    [[nodiscard]]
    inline bool empty() const { return size() == 0; }

    [[nodiscard]]
    inline std::size_t capacity() const noexcept { return slots_.size(); }

    [[nodiscard]]
    inline OverflowPolicy policy() const noexcept { return policy_; }

    // Messages lost to overflow since construction
    [[nodiscard]]
    inline std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

    // Messages admitted since construction (including later-evicted ones)
    [[nodiscard]]
    inline std::uint64_t pushed() const noexcept { return pushed_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    inline std::uint64_t popped() const noexcept { return popped_.load(std::memory_order_relaxed); }

private:
    // Requires mutex_ held
    inline bool take_(InboundMessage& out) {
        if (size_ == 0) {
            return false;
        }
        out = std::move(slots_[head_]);
        head_ = next_(head_);
        --size_;
        popped_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    inline std::size_t next_(std::size_t i) const noexcept {
        return (i + 1 == slots_.size()) ? 0 : i + 1;
    }

    inline std::size_t tail_() const noexcept {
        const std::size_t t = head_ + size_;
        return (t >= slots_.size()) ? t - slots_.size() : t;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;

    std::vector<InboundMessage> slots_;
    std::size_t head_{0};
    std::size_t size_{0};
    bool closed_{false};

    const OverflowPolicy policy_;
    std::uint64_t next_sequence_{1};

    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> pushed_{0};
    std::atomic<std::uint64_t> popped_{0};
};

} // namespace hashfeed::core::delivery
