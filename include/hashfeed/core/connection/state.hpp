#pragma once

#include <cstdint>
#include <string_view>


namespace hashfeed::core::connection {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
enum class State : uint8_t {
    Disconnected,    // Initial, and final after stop()
    Connecting,      // Connect attempt (and subscription replay) in progress
    Connected,       // Broker session live, subscriptions reconciled
    Backoff,         // Waiting for the retry timer
    Disconnecting    // Transient: explicit stop() tearing the transport down
};

// ------------------------------------------------------------
// State -> string
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:  return "Disconnected";
        case State::Connecting:    return "Connecting";
        case State::Connected:     return "Connected";
        case State::Backoff:       return "Backoff";
        case State::Disconnecting: return "Disconnecting";
        default:                   return "Unknown";
    }
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    StartRequested,
    StopRequested,

    // --- Transport lifecycle ---
    TransportConnected,       // connect() succeeded and replay completed
    TransportConnectFailed,   // connect() failed
    TransportLost,            // Unsolicited disconnect (or lost during replay)

    // --- Retry ---
    RetryTimerExpired
};

// ===============================================================
// Event -> string
// ===============================================================
[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::StartRequested:         return "StartRequested";
        case Event::StopRequested:          return "StopRequested";
        case Event::TransportConnected:     return "TransportConnected";
        case Event::TransportConnectFailed: return "TransportConnectFailed";
        case Event::TransportLost:          return "TransportLost";
        case Event::RetryTimerExpired:      return "RetryTimerExpired";
        default:                            return "UnknownEvent";
    }
}

} // namespace hashfeed::core::connection
