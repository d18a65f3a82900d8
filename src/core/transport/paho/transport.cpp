#include "hashfeed/core/transport/paho/transport.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <exception>
#include <utility>

#include "hashfeed/core/delivery/message.hpp"
#include "hashfeed/core/telemetry.hpp"
#include "hashfeed/log/logger.hpp"


namespace hashfeed::core::transport::paho {

namespace {

constexpr int QOS = 0;

// MQTT 3.1.1 CONNACK return codes 1..5: the broker answered and refused
[[nodiscard]]
inline bool is_connack_refusal(int rc) noexcept {
    return rc >= 1 && rc <= 5;
}

} // namespace

// -----------------------------------------------------------------------------
// Paho callback adapter
// -----------------------------------------------------------------------------
//
// Runs on the Paho callback thread. Forwards to the owning Transport, which
// guarantees nothing escapes.
class Transport::Callback final : public virtual ::mqtt::callback {
public:
    explicit Callback(Transport& owner) noexcept
        : owner_(owner)
    {
    }

    void connection_lost(const std::string& cause) override {
        owner_.on_connection_lost_(cause);
    }

    void message_arrived(::mqtt::const_message_ptr msg) override {
        owner_.on_message_(msg);
    }

    void delivery_complete(::mqtt::delivery_token_ptr) override {
        // QoS 0: nothing to track
    }

private:
    Transport& owner_;
};


Transport::Transport(delivery::Queue& queue, telemetry::Transport& telemetry)
    : queue_(queue)
    , telemetry_(telemetry)
    , client_id_(make_client_id_())
    , callback_(std::make_unique<Callback>(*this))
{
    HF_TRACE("[PAHO] Transport created (client id " << client_id_ << ")");
}

Transport::~Transport() {
    close();
    if (client_) {
        // No callback may reach a destroyed Transport. Paho refuses while a
        // connect or disconnect is still in flight.
        try {
            client_->disable_callbacks();
        }
        catch (const ::mqtt::exception& ex) {
            HF_DEBUG("[PAHO] disable_callbacks() on " << client_id_ << " refused (rc " << ex.get_return_code() << "): " << ex.what());
        }
    }
    HF_TRACE("[PAHO] Transport destroyed (client id " << client_id_ << ")");
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

ConnectError Transport::connect(const Endpoint& endpoint, std::chrono::milliseconds timeout) noexcept {
    // Single-use instance
    if (client_) {
        HF_WARN("[PAHO] connect() called on a used transport instance");
        return ConnectError::InvalidState;
    }
    const std::string uri = endpoint.uri();
    HF_DEBUG("[PAHO] Connecting to " << uri << " as " << client_id_ << " (timeout " << timeout.count() << " ms)");
    try {
        client_ = std::make_unique<::mqtt::async_client>(uri, client_id_);
        client_->set_callback(*callback_);

        ::mqtt::connect_options opts;
        opts.set_keep_alive_interval(endpoint.keep_alive);
        opts.set_clean_session(true);
        opts.set_automatic_reconnect(false);
        const auto connect_timeout = std::max(std::chrono::duration_cast<std::chrono::seconds>(timeout), std::chrono::seconds{1});
        opts.set_connect_timeout(connect_timeout);

        auto token = client_->connect(opts);
        if (!token->wait_for(timeout)) {
            HF_WARN("[PAHO] No CONNACK from " << uri << " within " << timeout.count() << " ms");
            abandon_connect_(token, connect_timeout);
            return ConnectError::Timeout;
        }
    }
    catch (const ::mqtt::exception& ex) {
        const int rc = ex.get_return_code();
        if (is_connack_refusal(rc)) {
            HF_WARN("[PAHO] Broker refused connection (rc " << rc << "): " << ex.what());
            return ConnectError::Refused;
        }
        HF_WARN("[PAHO] Broker unreachable (rc " << rc << "): " << ex.what());
        return ConnectError::Unreachable;
    }
    catch (const std::exception& ex) {
        HF_ERROR("[PAHO] connect() failed: " << ex.what());
        return ConnectError::Unreachable;
    }
    connected_.store(true, std::memory_order_release);
    HF_DEBUG("[PAHO] Connected to " << uri);
    return ConnectError::None;
}

void Transport::close() noexcept {
    // Close the session (idempotent)
    if (closing_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    const bool was_connected = connected_.exchange(false, std::memory_order_acq_rel);
    if (!client_ || !was_connected) {
        return;
    }
    HF_TRACE("[PAHO] Disconnecting " << client_id_ << " ...");
    try {
        auto token = client_->disconnect();
        if (!token->wait_for(request_timeout_)) {
            HF_WARN("[PAHO] Disconnect of " << client_id_ << " did not complete in time");
        }
    }
    catch (const ::mqtt::exception& ex) {
        // The link may already be gone: nothing left to release
        HF_DEBUG("[PAHO] Disconnect of " << client_id_ << " failed: " << ex.what());
    }
    catch (const std::exception& ex) {
        HF_WARN("[PAHO] Disconnect of " << client_id_ << " failed: " << ex.what());
    }
}

// A timed-out connect is still owned by the Paho client. Paho ends it on its
// own connect timeout; wait for that so the instance is idle when destroyed,
// and drop a CONNACK that arrives late.
void Transport::abandon_connect_(const ::mqtt::token_ptr& token, std::chrono::seconds connect_timeout) noexcept {
    closing_.store(true, std::memory_order_release);
    try {
        if (!token->wait_for(connect_timeout + request_timeout_)) {
            HF_WARN("[PAHO] Abandoned connect of " << client_id_ << " still pending");
            return;
        }
        HF_DEBUG("[PAHO] Late CONNACK for " << client_id_ << ", disconnecting");
        if (!client_->disconnect()->wait_for(request_timeout_)) {
            HF_WARN("[PAHO] Disconnect of " << client_id_ << " did not complete in time");
        }
    }
    catch (const ::mqtt::exception& ex) {
        // The pending connect failed: the client is idle
        HF_TRACE("[PAHO] Abandoned connect of " << client_id_ << " ended (rc " << ex.get_return_code() << ")");
    }
    catch (const std::exception& ex) {
        HF_WARN("[PAHO] Abandoning connect of " << client_id_ << " failed: " << ex.what());
    }
}

bool Transport::is_connected() const noexcept {
    return connected_.load(std::memory_order_acquire);
}

// -----------------------------------------------------------------------------
// Data plane
// -----------------------------------------------------------------------------

SendError Transport::send(const Topic& topic, std::string_view payload) noexcept {
    if (!client_ || !is_connected()) {
        return SendError::NotConnected;
    }
    if (payload.size() > config::MAX_PAYLOAD_SIZE) {
        return SendError::PayloadTooLarge;
    }
    try {
        // QoS 0: accepted by the client library == done
        client_->publish(::mqtt::make_message(topic.str(), payload.data(), payload.size(), QOS, false));
    }
    catch (const ::mqtt::exception& ex) {
        HF_WARN("[PAHO] publish to '" << topic << "' failed (rc " << ex.get_return_code() << "): " << ex.what());
        return is_connected() && client_->is_connected() ? SendError::TransportFailure : SendError::NotConnected;
    }
    catch (const std::exception& ex) {
        HF_ERROR("[PAHO] publish to '" << topic << "' failed: " << ex.what());
        return SendError::TransportFailure;
    }
    HF_TL1( telemetry_.messages_tx_total.inc() );
    HF_TL1( telemetry_.bytes_tx_total.inc(payload.size()) );
    HF_TRACE("[PAHO] -> " << topic << " (" << payload.size() << " bytes)");
    return SendError::None;
}

// -----------------------------------------------------------------------------
// Subscriptions
// -----------------------------------------------------------------------------

SubscriptionError Transport::subscribe(const Topic& topic) noexcept {
    if (!client_ || !is_connected()) {
        return SubscriptionError::NotConnected;
    }
    try {
        auto token = client_->subscribe(topic.str(), QOS);
        if (!token->wait_for(request_timeout_)) {
            HF_WARN("[PAHO] No SUBACK for '" << topic << "' within " << request_timeout_.count() << " ms");
            return SubscriptionError::Timeout;
        }
    }
    catch (const ::mqtt::exception& ex) {
        if (!is_connected() || !client_->is_connected()) {
            return SubscriptionError::NotConnected;
        }
        HF_WARN("[PAHO] subscribe '" << topic << "' rejected (rc " << ex.get_return_code() << "): " << ex.what());
        return SubscriptionError::Rejected;
    }
    catch (const std::exception& ex) {
        HF_ERROR("[PAHO] subscribe '" << topic << "' failed: " << ex.what());
        return SubscriptionError::Rejected;
    }
    HF_DEBUG("[PAHO] Subscribed to " << topic);
    return SubscriptionError::None;
}

SubscriptionError Transport::unsubscribe(const Topic& topic) noexcept {
    if (!client_ || !is_connected()) {
        return SubscriptionError::NotConnected;
    }
    try {
        auto token = client_->unsubscribe(topic.str());
        if (!token->wait_for(request_timeout_)) {
            HF_WARN("[PAHO] No UNSUBACK for '" << topic << "' within " << request_timeout_.count() << " ms");
            return SubscriptionError::Timeout;
        }
    }
    catch (const ::mqtt::exception& ex) {
        if (!is_connected() || !client_->is_connected()) {
            return SubscriptionError::NotConnected;
        }
        HF_WARN("[PAHO] unsubscribe '" << topic << "' rejected (rc " << ex.get_return_code() << "): " << ex.what());
        return SubscriptionError::Rejected;
    }
    catch (const std::exception& ex) {
        HF_ERROR("[PAHO] unsubscribe '" << topic << "' failed: " << ex.what());
        return SubscriptionError::Rejected;
    }
    HF_DEBUG("[PAHO] Unsubscribed from " << topic);
    return SubscriptionError::None;
}

// -----------------------------------------------------------------------------
// Paho callback thread
// -----------------------------------------------------------------------------

void Transport::on_connection_lost_(const std::string& cause) noexcept {
    connected_.store(false, std::memory_order_release);
    // A closing transport never reports an unsolicited disconnect
    if (closing_.load(std::memory_order_acquire)) {
        return;
    }
    // At most one Disconnected per connection
    if (lost_reported_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    HF_TL1( telemetry_.connection_lost_total.inc() );
    emit_(Event::make_disconnected());
    HF_WARN("[PAHO] Connection lost" << (cause.empty() ? "" : ": ") << cause);
}

void Transport::on_message_(const ::mqtt::const_message_ptr& msg) noexcept {
    if (!msg) {
        return;
    }
    try {
        delivery::InboundMessage m;
        const TopicError terr = Topic::parse(msg->get_topic(), m.topic);
        if (terr != TopicError::None) {
            HF_TL1( telemetry_.callback_failures_total.inc() );
            HF_WARN("[PAHO] Dropping message on invalid topic '" << msg->get_topic() << "' (" << to_string(terr) << ")");
            return;
        }
        m.payload = msg->to_string();
        m.received = std::chrono::system_clock::now();
        HF_TL1( telemetry_.messages_rx_total.inc() );
        HF_TL1( telemetry_.bytes_rx_total.inc(m.payload.size()) );
        HF_TRACE("[PAHO] <- " << m.topic << " (" << m.payload.size() << " bytes)");
        if (!queue_.push(std::move(m))) {
            HF_TL1( telemetry_.messages_rejected_total.inc() );
        }
    }
    catch (const std::exception& ex) {
        HF_TL1( telemetry_.callback_failures_total.inc() );
        HF_ERROR("[PAHO] message_arrived failed: " << ex.what());
    }
}

void Transport::emit_(Event ev) noexcept {
    if (events_.push(ev)) [[likely]] {
        return;
    }
    HF_TL1( telemetry_.events_dropped_total.inc() );
    HF_ERROR("[PAHO] Control event '" << to_string(ev.type) << "' dropped (event ring full)");
}

std::string Transport::make_client_id_() {
    static std::atomic<std::uint64_t> counter{0};
    const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "hashfeed-" + std::to_string(epoch) + "-" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

} // namespace hashfeed::core::transport::paho
