#pragma once

#include <chrono>
#include <concepts>
#include <string_view>

#include "hashfeed/core/topic.hpp"
#include "hashfeed/core/transport/endpoint.hpp"
#include "hashfeed/core/transport/error.hpp"
#include "hashfeed/core/transport/event.hpp"
#include "hashfeed/core/transport/telemetry.hpp"
#include "hashfeed/core/delivery/queue.hpp"

namespace hashfeed::core::transport {

// -----------------------------------------------------------------------------
// TransportConcept
// -----------------------------------------------------------------------------
//
// Defines the minimal contract required by the supervisor.
//
// One instance == one broker connection attempt. The supervisor creates a
// fresh instance per attempt and destroys it when that connection is over;
// the connected instance itself is the connection handle.
//
// The transport:
//
//   • Owns (or borrows from its client library) the I/O threads
//   • Pushes inbound messages into the delivery queue given at construction
//   • Pushes control-plane events into an internal SPSC ring
//   • Exposes poll_event() for the supervisor to drain
//   • Never retries and never reconnects on its own
//   • close() is idempotent and never reports an unsolicited disconnect
//
// -----------------------------------------------------------------------------

template<class T>
concept TransportConcept =
    std::constructible_from<T, delivery::Queue&, telemetry::Transport&> &&
    requires(
        T t,
        const Endpoint& ep,
        std::chrono::milliseconds timeout,
        const Topic& topic,
        std::string_view payload,
        Event ev
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { t.connect(ep, timeout) } noexcept -> std::same_as<ConnectError>;
    { t.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Data plane (outbound)
    // ---------------------------------------------------------------------

    { t.send(topic, payload) } noexcept -> std::same_as<SendError>;

    // ---------------------------------------------------------------------
    // Subscriptions
    // ---------------------------------------------------------------------

    { t.subscribe(topic) } noexcept -> std::same_as<SubscriptionError>;
    { t.unsubscribe(topic) } noexcept -> std::same_as<SubscriptionError>;

    // ---------------------------------------------------------------------
    // Control-plane polling
    // ---------------------------------------------------------------------

    { t.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace hashfeed::core::transport
