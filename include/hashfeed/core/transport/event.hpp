#pragma once

/*
===============================================================================
 hashfeed::core::transport::Event
===============================================================================

Control-plane record pushed by a transport's I/O context and drained by the
supervisor through poll_event(). It replaces a cross-thread "on disconnect"
callback with a lock-free SPSC hand-off, so the I/O thread never runs
supervisor logic and never waits on a supervisor lock.

Data-plane traffic (inbound messages) goes to the DeliveryQueue instead.

Reliability: a transport emits at most one Disconnected per connection, so a
small ring cannot overflow in practice; an overflow is logged by the
transport and the supervisor still observes the loss through the next
failing call.
===============================================================================
*/

#include <cstdint>
#include <string_view>
#include <type_traits>


namespace hashfeed::core::transport {

enum class EventType : std::uint8_t {
    None = 0,
    Disconnected,   // Unsolicited loss of the broker connection
};

[[nodiscard]]
inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
    case EventType::None:         return "None";
    case EventType::Disconnected: return "Disconnected";
    default:                      return "Unknown";
    }
}

struct Event {
    EventType type{EventType::None};

    static constexpr Event make_disconnected() noexcept {
        return Event{EventType::Disconnected};
    }
};

static_assert(std::is_trivially_copyable_v<Event>, "transport::Event must be trivially copyable");

} // namespace hashfeed::core::transport
