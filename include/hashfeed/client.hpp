#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "hashfeed/error.hpp"
#include "hashfeed/core/config/defaults.hpp"
#include "hashfeed/core/connection/signal.hpp"
#include "hashfeed/core/connection/state.hpp"
#include "hashfeed/core/delivery/message.hpp"
#include "hashfeed/core/delivery/overflow_policy.hpp"
#include "hashfeed/core/error.hpp"
#include "hashfeed/core/topic.hpp"
#include "hashfeed/core/transport/endpoint.hpp"
#include "hashfeed/core/transport/error.hpp"


namespace hashfeed {

// -----------------------------------------------------------------------------
// Client configuration
// -----------------------------------------------------------------------------
struct ClientConfig {
    /// Broker endpoint (host, port, keep-alive). See core::transport::parse_endpoint().
    core::transport::Endpoint endpoint{};

    std::chrono::milliseconds connect_timeout{core::config::DEFAULT_CONNECT_TIMEOUT};
    std::chrono::milliseconds backoff_floor{core::config::BACKOFF_FLOOR};
    std::chrono::milliseconds backoff_ceiling{core::config::BACKOFF_CEILING};
    int replay_attempts{core::config::REPLAY_ATTEMPTS};

    /// Inbound messages buffered before the overflow policy applies
    std::size_t queue_capacity{core::config::DELIVERY_QUEUE_CAPACITY};
    core::delivery::OverflowPolicy overflow_policy{core::delivery::OverflowPolicy::DropOldest};

    /// First topic segment of every hashtag ("#rust" -> "<namespace>/rust")
    std::string topic_namespace{core::config::TOPIC_NAMESPACE};
};


/*
===============================================================================
hashfeed Client
===============================================================================

Broker-backed hashtag feed client. Binds core::Session to the Eclipse Paho
transport and adds the hashtag vocabulary of the feed:

  subscribe_hashtag("#rust")                   -> subscribe("twitter/rust")
  publish_hashtag("rust", "alice", "hello")    -> publish("twitter/rust", "alice: hello")

Everything the core session guarantees holds here:
  - Automatic reconnect with backoff; subscriptions survive reconnects
  - Inbound messages in arrival order via pop() / pop_for()
  - publish() never buffers: it fails with NotConnected while disconnected

Threading:
  - All members are thread-safe
  - Connection management runs on an internal scheduler thread started by
    start() and joined by stop() (or the destructor)
===============================================================================
*/
class Client {
public:
    explicit Client(ClientConfig cfg = {});
    // Non-copyable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    // Destructor (stops the session)
    ~Client();

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]]
    core::transport::ConnectError start();

    void stop();

    [[nodiscard]]
    core::connection::State state() const noexcept;

    [[nodiscard]]
    bool poll_signal(core::connection::Signal& out) noexcept;

    // Blocks until Connected, the timeout expires or the client is stopped.
    [[nodiscard]]
    bool wait_connected(std::chrono::milliseconds timeout) const;

    // -------------------------------------------------------------------------
    // Hashtag API
    // -------------------------------------------------------------------------

    [[nodiscard]]
    Error subscribe_hashtag(std::string_view hashtag);

    [[nodiscard]]
    Error unsubscribe_hashtag(std::string_view hashtag);

    // Publishes "<username>: <message>" on the hashtag topic
    [[nodiscard]]
    Error publish_hashtag(std::string_view hashtag, std::string_view username, std::string_view message);

    // -------------------------------------------------------------------------
    // Topic API
    // -------------------------------------------------------------------------

    [[nodiscard]]
    core::transport::SubscriptionError subscribe(const core::Topic& topic);

    [[nodiscard]]
    core::transport::SubscriptionError unsubscribe(const core::Topic& topic);

    [[nodiscard]]
    core::PublishError publish(const core::Topic& topic, std::string_view payload);

    // -------------------------------------------------------------------------
    // Inbound messages
    // -------------------------------------------------------------------------

    // Blocks until a message arrives or the client is stopped
    [[nodiscard]]
    bool pop(core::delivery::InboundMessage& out);

    [[nodiscard]]
    bool pop_for(core::delivery::InboundMessage& out, std::chrono::milliseconds timeout);

    // -------------------------------------------------------------------------
    // Observability
    // -------------------------------------------------------------------------

    [[nodiscard]]
    std::uint64_t dropped() const noexcept;

    [[nodiscard]]
    std::vector<core::Topic> subscriptions() const;

    // False for hashtags that do not form a valid topic
    [[nodiscard]]
    bool is_following(std::string_view hashtag) const;

    [[nodiscard]]
    std::vector<core::Topic> degraded_topics() const;

    [[nodiscard]]
    std::chrono::milliseconds last_retry_delay() const noexcept;

    [[nodiscard]]
    const ClientConfig& config() const noexcept;

    void dump_telemetry(std::ostream& os) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hashfeed
