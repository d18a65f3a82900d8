#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include "hashfeed/core/connection/backoff.hpp"
#include "hashfeed/core/connection/config.hpp"
#include "hashfeed/core/connection/signal.hpp"
#include "hashfeed/core/connection/state.hpp"
#include "hashfeed/core/connection/telemetry.hpp"
#include "hashfeed/core/config/defaults.hpp"
#include "hashfeed/core/delivery/queue.hpp"
#include "hashfeed/core/subscription/registry.hpp"
#include "hashfeed/core/transport/concepts.hpp"
#include "hashfeed/core/transport/endpoint.hpp"
#include "hashfeed/core/transport/error.hpp"
#include "hashfeed/core/transport/event.hpp"
#include "hashfeed/core/telemetry.hpp"
#include "hashfeed/core/topic.hpp"
#include "hashfeed/lockfree/spsc_ring.hpp"
#include "hashfeed/log/logger.hpp"


namespace hashfeed::core::connection {

/*
===============================================================================
 hashfeed::core::connection::Supervisor
===============================================================================

Reconnecting broker session, parameterized by a transport implementation
conforming to transport::TransportConcept.

A Supervisor represents a *logical* session whose identity (endpoint,
desired subscriptions, delivery queue) remains stable across transport
failures and automatic reconnections. Each connect attempt uses a fresh
transport instance; the instance is the connection handle and is destroyed
when its connection is over.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Own the transport lifecycle (connect, detect loss, retry, close)
- Schedule retries with exponential backoff
- Replay the registry's active topics on every transition into Connected
- Gate facade I/O (publish / subscribe / unsubscribe) on the current state
- Expose observable consequences via edge-triggered signals

-------------------------------------------------------------------------------
 State Machine
-------------------------------------------------------------------------------

  Disconnected --start-------------------------> Connecting
  Connecting   --connect ok + replay-----------> Connected
  Connecting   --connect failed / lost---------> Backoff
  Connected    --unsolicited disconnect--------> Backoff
  Backoff      --retry timer elapsed-----------> Connecting
  any          --stop---> Disconnecting -------> Disconnected (terminal)

Retry delay is floor * 2^n capped at ceiling, n being the number of
consecutive failed cycles since the last Connected.

-------------------------------------------------------------------------------
 Replay
-------------------------------------------------------------------------------
On connect success, every active topic is subscribed once. A topic whose
subscribe fails is retried up to Config::replay_attempts times, then given up
on and reported through Signal::ReplayDegraded and degraded_topics(); the
other topics are unaffected. If the connection itself is lost mid-replay the
attempt counts as a failed cycle. Signal::Connected is emitted after replay.

-------------------------------------------------------------------------------
 Threading
-------------------------------------------------------------------------------
- poll() is driven by one scheduler thread; start(), stop(), the facade
  helpers and the accessors may be called from any thread
- io_mutex_ guards the transport instance and every call into it, and
  serializes all state mutations (and therefore all signal producers)
- The registry lock is never held across transport I/O
- state() is lock-free
- A facade call may wait on io_mutex_ for an in-flight connect attempt
  (bounded by the connect timeout)

-------------------------------------------------------------------------------
 Usage Model
-------------------------------------------------------------------------------
- Call start() once to activate the session
- Drive all progress by calling poll() regularly
- Observe progress via state(), poll_signal() and telemetry
- Call stop() to end the session; the Supervisor cannot be restarted

===============================================================================
*/

template <transport::TransportConcept T>
class Supervisor {
public:
    Supervisor(const transport::Endpoint& endpoint,
               subscription::Registry& registry,
               delivery::Queue& queue,
               telemetry::Supervisor& telemetry,
               const Config& config = {}) noexcept
        : endpoint_(endpoint)
        , config_(config)
        , registry_(registry)
        , queue_(queue)
        , telemetry_(telemetry)
    {
    }

    // Ensure transport is closed on destruction.
    // Reconnection is not attempted after object lifetime ends.
    ~Supervisor() {
        stop();
    }

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Arms the first connect attempt; it runs on the next poll().
    [[nodiscard]]
    inline transport::ConnectError start() {
        HF_TL1( telemetry_.start_calls_total.inc() ); // This represents explicit caller intent
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (stopped_) {
            HF_WARN("[SUP] start() called after stop(). Ignoring.");
            return transport::ConnectError::InvalidState;
        }
        if (get_state_() != State::Disconnected) {
            HF_WARN("[SUP] start() called while active (state: " << to_string(get_state_()) << "). Ignoring.");
            return transport::ConnectError::InvalidState;
        }
        HF_DEBUG("[SUP] Starting session with " << endpoint_.uri());
        transition_(Event::StartRequested);
        return transport::ConnectError::None;
    }

    // Unconditional shutdown: cancels any pending retry and closes the
    // current transport. Idempotent. Terminal.
    inline void stop() {
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (stopped_) {
            return; // idempotent
        }
        HF_TL1( telemetry_.stop_calls_total.inc() ); // This represents explicit user intent
        stopped_ = true;
        transition_(Event::StopRequested);
    }

    // Event loop
    inline void poll() {
        std::lock_guard<std::mutex> lock(io_mutex_);
        // === Drain transport events ===
        transport::Event ev;
        while (transport_ && transport_->poll_event(ev)) {
            switch (ev.type) {
                case transport::EventType::Disconnected:
                    on_transport_lost_();
                    break;

                case transport::EventType::None:
                default:
                    break;
            }
        }
        // === Connection logic ===
        switch (get_state_()) {
            case State::Connecting:
                connect_attempt_();
                break;

            case State::Backoff:
                if (std::chrono::steady_clock::now() >= next_retry_) {
                    transition_(Event::RetryTimerExpired);
                    connect_attempt_();
                }
                break;

            default:
                break;
        }
    }

    [[nodiscard]]
    inline bool poll_signal(Signal& out) noexcept {
        return signals_.pop(out);
    }

    // -------------------------------------------------------------------------
    // Facade I/O (gated on state, serialized with the scheduler)
    // -------------------------------------------------------------------------

    // No transport call unless Connected.
    [[nodiscard]]
    inline transport::SendError publish(const Topic& topic, std::string_view payload) {
        if (get_state_() != State::Connected) {
            return transport::SendError::NotConnected;
        }
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (get_state_() != State::Connected || !transport_) {
            return transport::SendError::NotConnected;
        }
        const auto err = transport_->send(topic, payload);
        if (err != transport::SendError::None) {
            HF_WARN("[SUP] Publish to '" << topic << "' failed (" << to_string(err) << ")");
        }
        return err;
    }

    // The caller records intent in the registry BEFORE calling these, so a
    // NotConnected result is picked up by the next replay. The lock-free early
    // return is only taken in states that precede the next replay snapshot.
    [[nodiscard]]
    inline transport::SubscriptionError subscribe(const Topic& topic) {
        if (!may_be_live_()) {
            return transport::SubscriptionError::NotConnected;
        }
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (get_state_() != State::Connected || !transport_) {
            return transport::SubscriptionError::NotConnected;
        }
        return transport_->subscribe(topic);
    }

    [[nodiscard]]
    inline transport::SubscriptionError unsubscribe(const Topic& topic) {
        if (!may_be_live_()) {
            return transport::SubscriptionError::NotConnected;
        }
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (get_state_() != State::Connected || !transport_) {
            return transport::SubscriptionError::NotConnected;
        }
        return transport_->unsubscribe(topic);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline State state() const noexcept {
        return get_state_();
    }

    [[nodiscard]]
    inline bool is_stopped() const {
        std::lock_guard<std::mutex> lock(io_mutex_);
        return stopped_;
    }

    // Incremented once per transition into Connected
    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return epoch_.load(std::memory_order_relaxed);
    }

    // Delay armed by the most recent entry into Backoff
    [[nodiscard]]
    inline std::chrono::milliseconds last_retry_delay() const noexcept {
        return std::chrono::milliseconds{last_retry_delay_ms_.load(std::memory_order_relaxed)};
    }

    // Topics the last replay gave up on (empty after a clean replay)
    [[nodiscard]]
    inline std::vector<Topic> degraded_topics() const {
        std::lock_guard<std::mutex> lock(io_mutex_);
        return degraded_;
    }

    [[nodiscard]]
    inline transport::ConnectError last_connect_error() const {
        std::lock_guard<std::mutex> lock(io_mutex_);
        return last_error_;
    }

    [[nodiscard]]
    inline const transport::Endpoint& endpoint() const noexcept {
        return endpoint_;
    }

    [[nodiscard]]
    inline const Config& config() const noexcept {
        return config_;
    }

#ifdef HF_UNIT_TEST
public:
    // Current transport instance (nullptr between connections)
    T* current_transport() noexcept {
        return transport_.get();
    }

    // Make the pending retry timer due on the next poll()
    inline void force_retry_due() {
        std::lock_guard<std::mutex> lock(io_mutex_);
        next_retry_ = std::chrono::steady_clock::now();
    }

    [[nodiscard]]
    inline int retry_cycles() const {
        std::lock_guard<std::mutex> lock(io_mutex_);
        return retry_cycles_;
    }
#endif // HF_UNIT_TEST

private:
    const transport::Endpoint endpoint_;
    const Config config_;

    subscription::Registry& registry_;              // Desired subscriptions (not owned)
    delivery::Queue& queue_;                        // Inbound hand-off (not owned)
    telemetry::Supervisor& telemetry_;              // Telemetry reference (not owned)

    mutable std::mutex io_mutex_;
    std::unique_ptr<T> transport_;                  // Current connection handle (owned)

    // State machine
    std::atomic<State> state_{State::Disconnected};
    bool stopped_{false};
    std::chrono::steady_clock::time_point next_retry_{};
    int retry_cycles_{0};                           // Consecutive failed cycles since last Connected
    transport::ConnectError last_error_{transport::ConnectError::None};

    std::atomic<std::uint64_t> epoch_{0};
    std::atomic<std::chrono::milliseconds::rep> last_retry_delay_ms_{0};

    std::vector<Topic> degraded_;

    // The pending observable signals
    lockfree::spsc_ring<Signal, config::SIGNAL_RING_CAPACITY> signals_;

private:
    // Requires io_mutex_ held (all producers are serialized by it)
    inline void emit_(Signal sig) noexcept {
        HF_TRACE("[SUP] Emitting signal: " << to_string(sig));
        if (signals_.push(sig)) [[likely]] {
            return;
        }
        HF_TL1( telemetry_.signals_dropped_total.inc() );
        HF_WARN("[SUP] Signal '" << to_string(sig) << "' dropped (user is not draining poll_signal())");
    }

    // State accessor
    inline State get_state_() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    // State mutator with logging
    inline void set_state_(State new_state) noexcept {
        HF_TRACE("[SUP] State:  " << to_string(get_state_()) << " -> " << to_string(new_state));
        state_.store(new_state, std::memory_order_release);
    }

    // False only in states that precede the next replay snapshot
    inline bool may_be_live_() const noexcept {
        const State s = get_state_();
        return s == State::Connecting || s == State::Connected;
    }

    // State machine transition function (requires io_mutex_ held)
    inline void transition_(Event event) {
        const State state = get_state_();

        HF_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "-->");

        // Stop is accepted in every state
        if (event == Event::StopRequested) {
            if (state == State::Connected || state == State::Connecting || state == State::Backoff) {
                HF_DEBUG("[SUP] Disconnecting from: " << endpoint_.uri());
                set_state_(State::Disconnecting);
                destroy_transport_();
                HF_INFO("[SUP] Disconnected from broker: " << endpoint_.uri());
            }
            set_state_(State::Disconnected);
            emit_(Signal::Stopped);
            return;
        }

        switch (state) {

        // ================================================================
        case State::Disconnected:
            switch (event) {
            case Event::StartRequested:
                set_state_(State::Connecting);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportConnected:
                set_state_(State::Connected);
                HF_TL1( telemetry_.connect_success_total.inc() ); // This reflects a state-machine fact, not a transport fact.
                // Reset retry state
                retry_cycles_ = 0;
                last_error_ = transport::ConnectError::None;
                // Only increment on Connected (never on retries, attempts, or disconnections)
                epoch_.fetch_add(1, std::memory_order_relaxed);
                emit_(Signal::Connected);
                break;

            case Event::TransportConnectFailed:
                HF_TL1( telemetry_.connect_failure_total.inc() );
                destroy_transport_();
                enter_backoff_();
                break;

            case Event::TransportLost:
                destroy_transport_();
                enter_backoff_();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::TransportLost:
                emit_(Signal::Disconnected);
                destroy_transport_();
                enter_backoff_();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Backoff:
            switch (event) {
            case Event::RetryTimerExpired:
                set_state_(State::Connecting);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Disconnecting:
        default:
            break;
        }
    }

    // One connect attempt on a fresh transport, followed by replay on success
    inline void connect_attempt_() {
        HF_DEBUG("[SUP] Connecting to: " << endpoint_.uri() << " (cycle " << retry_cycles_ << ")");
        HF_TL1( telemetry_.connect_attempts_total.inc() ); // One attempt = one call
        create_transport_();
        last_error_ = transport_->connect(endpoint_, config_.connect_timeout);
        if (last_error_ != transport::ConnectError::None) {
            HF_ERROR("[SUP] Connection failed (" << to_string(last_error_) << ")");
            transition_(Event::TransportConnectFailed);
            return;
        }
        if (!replay_subscriptions_()) {
            HF_WARN("[SUP] Connection lost during subscription replay");
            HF_TL1( telemetry_.disconnect_events_total.inc() );
            transition_(Event::TransportLost);
            return;
        }
        transition_(Event::TransportConnected);
        HF_INFO("[SUP] Connected to broker: " << endpoint_.uri());
    }

    // Returns false if the connection was lost while replaying.
    inline bool replay_subscriptions_() {
        degraded_.clear();
        const std::vector<Topic> topics = registry_.active_topics();
        if (topics.empty()) {
            return true;
        }
        HF_DEBUG("[SUP] Replaying " << topics.size() << " subscription(s)");
        const int attempts = config_.replay_attempts < 1 ? 1 : config_.replay_attempts;
        for (const Topic& topic : topics) {
            bool done = false;
            for (int attempt = 1; attempt <= attempts && !done; ++attempt) {
                const auto err = transport_->subscribe(topic);
                switch (err) {
                case transport::SubscriptionError::None:
                    HF_TL1( telemetry_.replay_subscriptions_total.inc() );
                    done = true;
                    break;

                case transport::SubscriptionError::NotConnected:
                    HF_TL1( telemetry_.replay_failures_total.inc() );
                    return false;

                default:
                    HF_TL1( telemetry_.replay_failures_total.inc() );
                    HF_DEBUG("[SUP] Replay of '" << topic << "' failed (" << to_string(err)
                             << ", attempt " << attempt << "/" << attempts << ")");
                    break;
                }
            }
            if (!done) {
                HF_WARN("[SUP] Giving up replaying subscription '" << topic << "' after " << attempts << " attempt(s)");
                HF_TL1( telemetry_.replay_degraded_total.inc() );
                degraded_.push_back(topic);
            }
        }
        if (!degraded_.empty()) {
            emit_(Signal::ReplayDegraded);
        }
        return true;
    }

    inline void on_transport_lost_() {
        // Only a live session can be lost; losses seen while Connecting are resolved by connect_attempt_()
        if (get_state_() != State::Connected) {
            return;
        }
        HF_TL1( telemetry_.disconnect_events_total.inc() ); // transport loss as observed by the Supervisor
        HF_INFO("[SUP] Connection lost: " << endpoint_.uri());
        transition_(Event::TransportLost);
    }

    inline void enter_backoff_() {
        HF_TL1( telemetry_.retry_cycles_started_total.inc() );
        set_state_(State::Backoff);
        const auto delay = backoff(retry_cycles_, config_.backoff_floor, config_.backoff_ceiling);
        ++retry_cycles_;
        next_retry_ = std::chrono::steady_clock::now() + delay;
        last_retry_delay_ms_.store(delay.count(), std::memory_order_relaxed);
        emit_(Signal::RetryScheduled);
        HF_INFO("[SUP] Next connection attempt in " << delay.count() << " ms");
    }

    inline void create_transport_() {
        // If exists, ensure old transport is torn down deterministically
        destroy_transport_();
        transport_ = std::make_unique<T>(queue_, telemetry_.transport);
    }

    inline void destroy_transport_() noexcept {
        if (transport_) {
            transport_->close();
            transport_.reset();
        }
    }
};

} // namespace hashfeed::core::connection
