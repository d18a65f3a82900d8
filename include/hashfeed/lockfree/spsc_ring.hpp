// -----------------------------------------------------------------------------
// Bounded SPSC ring with compile-time capacity.
//
// Used for control-plane channels only (transport events, supervisor signals):
// small trivially-copyable records, one producer thread, one consumer thread.
// Lock-free and allocation-free; push() fails when full instead of blocking.
//
// Capacity must be a power of two. One slot is kept empty to tell full from
// empty, so at most Capacity - 1 items are stored.
// -----------------------------------------------------------------------------
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <utility>


namespace hashfeed::lockfree {

template <typename T, std::size_t Capacity>
class spsc_ring {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");

public:
    spsc_ring() noexcept = default;

    spsc_ring(const spsc_ring&) = delete;
    spsc_ring& operator=(const spsc_ring&) = delete;

    // Producer side
    [[nodiscard]] inline bool push(const T& item) noexcept {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & MASK;
        if (next == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        buffer_[head] = item;
        head_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer side
    [[nodiscard]] inline bool pop(T& out) noexcept {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) {
            return false;
        }
        out = std::move(buffer_[tail]);
        tail_.store((tail + 1) & MASK, std::memory_order_release);
        return true;
    }

    [[nodiscard]] inline bool empty() const noexcept {
        return tail_.load(std::memory_order_acquire) == head_.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline std::size_t size() const noexcept {
        return (head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire)) & MASK;
    }

    [[nodiscard]] inline constexpr std::size_t capacity() const noexcept { return Capacity - 1; }

private:
    static constexpr std::size_t MASK = Capacity - 1;

    std::array<T, Capacity> buffer_{};
    alignas(64) std::atomic<std::size_t> head_{0};
    alignas(64) std::atomic<std::size_t> tail_{0};
};

} // namespace hashfeed::lockfree
