#include <ostream>
#include <string>
#include <thread>
#include <utility>

#include "hashfeed/client.hpp"

// ---- Core includes (PRIVATE) ----
#include "hashfeed/core/session.hpp"
#include "hashfeed/core/payload.hpp"
#include "hashfeed/core/transport/paho/transport.hpp"
#include "hashfeed/format.hpp"
#include "hashfeed/log/logger.hpp"


namespace hashfeed {

using Transport = core::transport::paho::Transport;

namespace {

[[nodiscard]]
core::SessionConfig make_session_config(const ClientConfig& cfg) {
    core::SessionConfig out;
    out.endpoint = cfg.endpoint;
    out.connection.connect_timeout = cfg.connect_timeout;
    out.connection.backoff_floor = cfg.backoff_floor;
    out.connection.backoff_ceiling = cfg.backoff_ceiling;
    out.connection.replay_attempts = cfg.replay_attempts;
    out.queue_capacity = cfg.queue_capacity;
    out.overflow_policy = cfg.overflow_policy;
    return out;
}

} // namespace

// -----------------------------
// Impl
// -----------------------------

struct Client::Impl {
    ClientConfig cfg;

    // Core session (owning)
    core::Session<Transport> session;

    explicit Impl(ClientConfig c)
        : cfg(std::move(c))
        , session(make_session_config(cfg))
    {
    }

    [[nodiscard]]
    Error hashtag_topic(std::string_view hashtag, core::Topic& out) const {
        return to_error(core::make_topic_from_hashtag(hashtag, out, cfg.topic_namespace), hashtag);
    }
};

// -----------------------------
// Client
// -----------------------------

Client::Client(ClientConfig cfg)
    : impl_(std::make_unique<Impl>(std::move(cfg)))
{
}

Client::~Client() = default;

core::transport::ConnectError Client::start() {
    return impl_->session.start();
}

void Client::stop() {
    impl_->session.stop();
}

core::connection::State Client::state() const noexcept {
    return impl_->session.state();
}

bool Client::poll_signal(core::connection::Signal& out) noexcept {
    return impl_->session.poll_signal(out);
}

bool Client::wait_connected(std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        const auto s = impl_->session.state();
        if (s == core::connection::State::Connected) {
            return true;
        }
        // Never started, or stopped
        if (s == core::connection::State::Disconnected) {
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(core::config::SUPERVISOR_TICK);
    }
}

// -----------------------------
// Hashtag API
// -----------------------------

Error Client::subscribe_hashtag(std::string_view hashtag) {
    core::Topic topic;
    if (auto e = impl_->hashtag_topic(hashtag, topic); !e.ok()) {
        return e;
    }
    return to_error(impl_->session.subscribe(topic), topic);
}

Error Client::unsubscribe_hashtag(std::string_view hashtag) {
    core::Topic topic;
    if (auto e = impl_->hashtag_topic(hashtag, topic); !e.ok()) {
        return e;
    }
    return to_error(impl_->session.unsubscribe(topic), topic);
}

Error Client::publish_hashtag(std::string_view hashtag, std::string_view username, std::string_view message) {
    core::Topic topic;
    if (auto e = impl_->hashtag_topic(hashtag, topic); !e.ok()) {
        return e;
    }
    std::string payload;
    if (auto e = to_error(core::compose_payload(username, message, payload)); !e.ok()) {
        return e;
    }
    return to_error(impl_->session.publish(topic, payload), topic);
}

// -----------------------------
// Topic API
// -----------------------------

core::transport::SubscriptionError Client::subscribe(const core::Topic& topic) {
    return impl_->session.subscribe(topic);
}

core::transport::SubscriptionError Client::unsubscribe(const core::Topic& topic) {
    return impl_->session.unsubscribe(topic);
}

core::PublishError Client::publish(const core::Topic& topic, std::string_view payload) {
    return impl_->session.publish(topic, payload);
}

// -----------------------------
// Inbound messages
// -----------------------------

bool Client::pop(core::delivery::InboundMessage& out) {
    return impl_->session.pop(out);
}

bool Client::pop_for(core::delivery::InboundMessage& out, std::chrono::milliseconds timeout) {
    return impl_->session.pop_for(out, timeout);
}

// -----------------------------
// Observability
// -----------------------------

std::uint64_t Client::dropped() const noexcept {
    return impl_->session.dropped();
}

std::vector<core::Topic> Client::subscriptions() const {
    return impl_->session.subscriptions();
}

bool Client::is_following(std::string_view hashtag) const {
    core::Topic topic;
    if (!impl_->hashtag_topic(hashtag, topic).ok()) {
        return false;
    }
    return impl_->session.is_subscribed(topic);
}

std::vector<core::Topic> Client::degraded_topics() const {
    return impl_->session.degraded_topics();
}

std::chrono::milliseconds Client::last_retry_delay() const noexcept {
    return impl_->session.last_retry_delay();
}

const ClientConfig& Client::config() const noexcept {
    return impl_->cfg;
}

void Client::dump_telemetry(std::ostream& os) const {
    impl_->session.telemetry().debug_dump(os);
    os << "\n=== Delivery ===\n";
    os << "  Dropped (overflow)    : " << format_number_exact(impl_->session.dropped()) << '\n';
    os << "  Pending               : " << format_number_exact(impl_->session.pending()) << '\n';
}

} // namespace hashfeed
