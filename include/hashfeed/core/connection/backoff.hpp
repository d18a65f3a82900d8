#pragma once

#include <algorithm>
#include <chrono>


namespace hashfeed::core::connection {

// ---------------------------------------------------------------------
// Exponential retry delay
//
//   cycle 0 -> floor
//   cycle 1 -> floor * 2
//   cycle n -> min(floor * 2^n, ceiling)
//
// `cycle` is the number of consecutive failed cycles since the session was
// last Connected. The exponent is clamped so the shift never overflows.
// ---------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::chrono::milliseconds backoff(int cycle,
                                                   std::chrono::milliseconds floor,
                                                   std::chrono::milliseconds ceiling) noexcept {
    cycle = std::clamp(cycle, 0, 20);
    const auto delay = floor * (1LL << cycle);
    return std::min(std::chrono::duration_cast<std::chrono::milliseconds>(delay), ceiling);
}

} // namespace hashfeed::core::connection
