#pragma once

#include <string_view>


namespace hashfeed::core::delivery {

// ============================================================================
// Overflow Policy
// ============================================================================
//
// What the DeliveryQueue does when a push finds it full. Both policies keep
// the producer (broker I/O thread) non-blocking and count one drop.
//
// DropOldest -> evict the oldest unconsumed message, admit the new one
//               (freshness over completeness; right for a live feed)
// DropNewest -> reject the incoming message, keep the backlog intact
// ============================================================================

enum class OverflowPolicy {
    DropOldest,
    DropNewest
};

[[nodiscard]]
inline constexpr std::string_view to_string(OverflowPolicy p) noexcept {
    switch (p) {
    case OverflowPolicy::DropOldest: return "DropOldest";
    case OverflowPolicy::DropNewest: return "DropNewest";
    default:                         return "Unknown";
    }
}

} // namespace hashfeed::core::delivery
