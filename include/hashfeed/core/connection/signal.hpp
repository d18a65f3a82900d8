/*
===============================================================================
 Connection Signals
===============================================================================

connection::Signal represents **externally observable, edge-triggered facts**
emitted by connection::Supervisor via its poll_signal() interface.

Signals are:
  - Edge-triggered (not level- or state-based)
  - Single-shot per occurrence
  - Allocation-free and callback-free

The full state is always available through state(); signals exist so a
consumer (UI, log, tool) can react to transitions without polling state in
a loop.

-------------------------------------------------------------------------------
 Delivery Semantics
-------------------------------------------------------------------------------

- Signals are pushed into a bounded, lock-free SPSC ring buffer
- If the buffer is full the new signal is dropped, logged and counted
- Signals are informational: missing one never affects the session

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Connected
  The broker session is live and every active subscription has been
  replayed (or reported as degraded). Emitted once per transport lifetime.

Disconnected
  A live broker session was lost unexpectedly. Followed by RetryScheduled.

RetryScheduled
  A connect attempt failed or the session was lost; the next attempt is
  armed according to the backoff policy (see last_retry_delay()).

ReplayDegraded
  At least one active topic could not be re-subscribed after a reconnect
  within the configured number of attempts (see degraded_topics()).
  The session is Connected regardless.

Stopped
  stop() completed. Terminal.

===============================================================================
*/
#pragma once

#include <cstdint>
#include <string_view>


namespace hashfeed::core::connection {

enum class Signal : uint8_t {
    None,             // No externally observable signal
    Connected,        // Broker session established, subscriptions replayed
    Disconnected,     // Broker session lost unexpectedly
    RetryScheduled,   // Entered / continued the backoff cycle
    ReplayDegraded,   // Some subscriptions could not be replayed
    Stopped,          // Explicit stop completed (terminal)
};

[[nodiscard]]
inline constexpr std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:           return "None";
        case Signal::Connected:      return "Connected";
        case Signal::Disconnected:   return "Disconnected";
        case Signal::RetryScheduled: return "RetryScheduled";
        case Signal::ReplayDegraded: return "ReplayDegraded";
        case Signal::Stopped:        return "Stopped";
        default:                     return "Unknown";
    }
}

} // namespace hashfeed::core::connection
