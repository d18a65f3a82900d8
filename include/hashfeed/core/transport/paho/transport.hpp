#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <mqtt/async_client.h>

#include "hashfeed/core/config/defaults.hpp"
#include "hashfeed/core/delivery/queue.hpp"
#include "hashfeed/core/topic.hpp"
#include "hashfeed/core/transport/concepts.hpp"
#include "hashfeed/core/transport/endpoint.hpp"
#include "hashfeed/core/transport/error.hpp"
#include "hashfeed/core/transport/event.hpp"
#include "hashfeed/core/transport/telemetry.hpp"
#include "hashfeed/lockfree/spsc_ring.hpp"

/*
================================================================================
MQTT Transport (Eclipse Paho C++ implementation)
================================================================================

Single-connection transport primitive over mqtt::async_client:

  • One instance == one connection attempt; never retries, never reconnects
    (automatic reconnect is disabled, the supervisor owns recovery)
  • Clean session, QoS 0, keep-alive taken from the endpoint
  • Client id "hashfeed-<epoch-seconds>-<n>", unique per process
  • Inbound messages are pushed into the delivery queue directly from the
    Paho callback thread
  • Unsolicited connection loss is reported exactly once as an Event on the
    control ring, drained by the supervisor through poll_event()
  • No exception leaves a Paho callback or a public member; library errors
    are classified into the transport error enums

Paho runs its own I/O threads: the only state shared with them is the
delivery queue (thread-safe), the control ring (single producer: the Paho
callback thread) and atomics.
================================================================================
*/

namespace hashfeed::core::transport::paho {

class Transport {
public:
    Transport(delivery::Queue& queue, telemetry::Transport& telemetry);
    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    [[nodiscard]]
    ConnectError connect(const Endpoint& endpoint, std::chrono::milliseconds timeout) noexcept;

    void close() noexcept;

    // ---------------------------------------------------------------------
    // Data plane
    // ---------------------------------------------------------------------

    [[nodiscard]]
    SendError send(const Topic& topic, std::string_view payload) noexcept;

    // ---------------------------------------------------------------------
    // Subscriptions (block until SUBACK / UNSUBACK or request timeout)
    // ---------------------------------------------------------------------

    [[nodiscard]]
    SubscriptionError subscribe(const Topic& topic) noexcept;

    [[nodiscard]]
    SubscriptionError unsubscribe(const Topic& topic) noexcept;

    // ---------------------------------------------------------------------
    // Control-plane polling
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline bool poll_event(Event& out) noexcept {
        return events_.pop(out);
    }

    [[nodiscard]]
    inline const std::string& client_id() const noexcept {
        return client_id_;
    }

    [[nodiscard]]
    bool is_connected() const noexcept;

private:
    class Callback;
    friend class Callback;

    // Paho callback thread entry points
    void on_connection_lost_(const std::string& cause) noexcept;
    void on_message_(const ::mqtt::const_message_ptr& msg) noexcept;

    void emit_(Event ev) noexcept;

    void abandon_connect_(const ::mqtt::token_ptr& token, std::chrono::seconds connect_timeout) noexcept;

    static std::string make_client_id_();

private:
    delivery::Queue& queue_;
    telemetry::Transport& telemetry_;

    std::string client_id_;
    std::chrono::milliseconds request_timeout_{config::DEFAULT_REQUEST_TIMEOUT};

    std::atomic<bool> connected_{false};
    std::atomic<bool> closing_{false};
    std::atomic<bool> lost_reported_{false};

    // Control events (Paho callback thread -> supervisor)
    lockfree::spsc_ring<Event, config::TRANSPORT_EVENT_RING_CAPACITY> events_;

    // Declared before client_: must outlive it
    std::unique_ptr<Callback> callback_;
    std::unique_ptr<::mqtt::async_client> client_;
};

// Assert that the production transport conforms to transport::TransportConcept
static_assert(TransportConcept<Transport>);

} // namespace hashfeed::core::transport::paho
