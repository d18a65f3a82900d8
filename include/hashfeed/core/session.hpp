/*
===============================================================================
hashfeed core Session
===============================================================================

Public publish / subscribe / unsubscribe facade over a reconnecting broker
session. Composes:

  - subscription::Registry   -> desired topic set (survives reconnects)
  - delivery::Queue          -> ordered, bounded inbound hand-off
  - connection::Supervisor   -> connection state machine, backoff, replay
  - one scheduler thread     -> drives Supervisor::poll() every tick

The Session:
  - Owns all of the above by composition
  - Is parameterized by the transport (TransportConcept) so the same facade
    runs against the broker client in production and a mock in tests
  - Returns every outcome as a typed error; nothing is thrown across it
  - Never buffers or retries a publish

Subscription model:
  - subscribe()/unsubscribe() record intent in the registry first
  - When Connected the broker call is issued immediately and its result
    returned
  - Otherwise NotConnected is returned: the intent is kept and applied by
    the replay that follows the next successful connect

Data-plane model:
  - The broker I/O threads push InboundMessage into the delivery queue
  - Consumers pull with pop() / pop_for() / try_pop() / drain() from any
    thread, in arrival order across all topics

Shutdown (stop(), also run by the destructor):
  1) the scheduler thread is woken and joined (pending backoff cancelled)
  2) the supervisor closes the current transport
  3) the delivery queue is closed so blocked pop() callers return false
stop() is terminal; start() afterwards returns ConnectError::InvalidState.
===============================================================================
*/

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "hashfeed/core/config/session.hpp"
#include "hashfeed/core/connection/signal.hpp"
#include "hashfeed/core/connection/state.hpp"
#include "hashfeed/core/connection/supervisor.hpp"
#include "hashfeed/core/connection/telemetry.hpp"
#include "hashfeed/core/delivery/message.hpp"
#include "hashfeed/core/delivery/queue.hpp"
#include "hashfeed/core/error.hpp"
#include "hashfeed/core/subscription/registry.hpp"
#include "hashfeed/core/telemetry.hpp"
#include "hashfeed/core/topic.hpp"
#include "hashfeed/core/transport/concepts.hpp"
#include "hashfeed/core/transport/error.hpp"
#include "hashfeed/log/logger.hpp"


namespace hashfeed::core {

template<transport::TransportConcept T>
class Session {
public:
    explicit Session(const SessionConfig& config = {})
        : config_(config)
        , queue_(config.queue_capacity, config.overflow_policy)
        , supervisor_(config.endpoint, registry_, queue_, telemetry_, config.connection)
    {
    }

    ~Session() {
        stop();
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Arms the first connect attempt and launches the scheduler thread.
    // Returns immediately; observe progress through state() / poll_signal().
    [[nodiscard]]
    inline transport::ConnectError start() {
        const auto err = supervisor_.start();
        if (err != transport::ConnectError::None) {
            return err;
        }
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!scheduler_.joinable()) {
            scheduler_ = std::thread(&Session::run_scheduler_, this);
        }
        return err;
    }

    inline void stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        // 1) Stop the scheduler thread
        {
            std::lock_guard<std::mutex> wake_lock(wake_mutex_);
            stop_requested_ = true;
        }
        wake_cv_.notify_all();
        if (scheduler_.joinable()) {
            scheduler_.join();
        }
        // 2) Close the transport (terminal for the supervisor)
        supervisor_.stop();
        // 3) Release blocked consumers
        queue_.close();
    }

    // -------------------------------------------------------------------------
    // Publish / subscribe
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline PublishError publish(const Topic& topic, std::string_view payload) {
        HF_TL1( telemetry_.publish_calls_total.inc() );
        if (topic.has_wildcard()) {
            HF_WARN("[SESSION] Refusing to publish to wildcard topic '" << topic << "'");
            HF_TL1( telemetry_.publish_rejected_total.inc() );
            return PublishError::InvalidTopic;
        }
        if (payload.size() > config_.max_payload) {
            HF_WARN("[SESSION] Refusing " << payload.size() << " byte payload to '" << topic << "' (limit " << config_.max_payload << ")");
            HF_TL1( telemetry_.publish_rejected_total.inc() );
            return PublishError::PayloadTooLarge;
        }
        const auto err = to_publish_error(supervisor_.publish(topic, payload));
        if (err == PublishError::NotConnected) {
            HF_DEBUG("[SESSION] publish() while " << to_string(supervisor_.state()) << " - not sent");
            HF_TL1( telemetry_.publish_rejected_total.inc() );
        }
        return err;
    }

    [[nodiscard]]
    inline transport::SubscriptionError subscribe(const Topic& topic) {
        HF_TL1( telemetry_.subscribe_calls_total.inc() );
        if (registry_.set_active(topic)) {
            HF_INFO("[SESSION] Subscribing to " << topic);
        }
        const auto err = supervisor_.subscribe(topic);
        if (err != transport::SubscriptionError::None && err != transport::SubscriptionError::NotConnected) {
            HF_WARN("[SESSION] Subscribe to '" << topic << "' failed (" << to_string(err) << "), kept for replay");
        }
        return err;
    }

    [[nodiscard]]
    inline transport::SubscriptionError unsubscribe(const Topic& topic) {
        HF_TL1( telemetry_.unsubscribe_calls_total.inc() );
        if (registry_.set_inactive(topic)) {
            HF_INFO("[SESSION] Unsubscribing from " << topic);
        }
        const auto err = supervisor_.unsubscribe(topic);
        if (err != transport::SubscriptionError::None && err != transport::SubscriptionError::NotConnected) {
            HF_WARN("[SESSION] Unsubscribe from '" << topic << "' failed (" << to_string(err) << ")");
        }
        return err;
    }

    // -------------------------------------------------------------------------
    // Observation
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline connection::State state() const noexcept {
        return supervisor_.state();
    }

    [[nodiscard]]
    inline bool poll_signal(connection::Signal& out) noexcept {
        return supervisor_.poll_signal(out);
    }

    // Active topics, in first-subscribed order
    [[nodiscard]]
    inline std::vector<Topic> subscriptions() const {
        return registry_.active_topics();
    }

    [[nodiscard]]
    inline bool is_subscribed(const Topic& topic) const {
        return registry_.is_active(topic);
    }

    [[nodiscard]]
    inline std::vector<Topic> degraded_topics() const {
        return supervisor_.degraded_topics();
    }

    [[nodiscard]]
    inline std::chrono::milliseconds last_retry_delay() const noexcept {
        return supervisor_.last_retry_delay();
    }

    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return supervisor_.epoch();
    }

    [[nodiscard]]
    inline const connection::telemetry::Supervisor& telemetry() const noexcept {
        return telemetry_;
    }

    [[nodiscard]]
    inline const SessionConfig& config() const noexcept {
        return config_;
    }

    // -------------------------------------------------------------------------
    // Inbound message access
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline bool pop(delivery::InboundMessage& out) {
        return queue_.pop(out);
    }

    template<class Rep, class Period>
    [[nodiscard]]
    inline bool pop_for(delivery::InboundMessage& out, std::chrono::duration<Rep, Period> timeout) {
        return queue_.pop_for(out, timeout);
    }

    [[nodiscard]]
    inline bool try_pop(delivery::InboundMessage& out) {
        return queue_.try_pop(out);
    }

    template<class F>
    inline std::size_t drain(F&& f) {
        return queue_.drain(std::forward<F>(f));
    }

    // Messages lost to delivery queue overflow
    [[nodiscard]]
    inline std::uint64_t dropped() const noexcept {
        return queue_.dropped();
    }

    [[nodiscard]]
    inline std::size_t pending() const {
        return queue_.size();
    }

#ifdef HF_UNIT_TEST
public:
    connection::Supervisor<T>& supervisor() noexcept {
        return supervisor_;
    }

    delivery::Queue& queue() noexcept {
        return queue_;
    }

    // Wake the scheduler now instead of at the next tick
    inline void wake() {
        wake_cv_.notify_all();
    }
#endif // HF_UNIT_TEST

private:
    const SessionConfig config_;

    // Telemetry must outlive the supervisor and its transports
    connection::telemetry::Supervisor telemetry_;
    subscription::Registry registry_;
    delivery::Queue queue_;
    connection::Supervisor<T> supervisor_;

    // Scheduler
    std::mutex lifecycle_mutex_;        // Serializes start()/stop() thread handling
    std::thread scheduler_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool stop_requested_{false};

    inline void run_scheduler_() noexcept {
        HF_DEBUG("[SESSION] Scheduler started (tick " << config_.tick.count() << " ms)");
        for (;;) {
            try {
                supervisor_.poll();
            }
            catch (const std::exception& ex) {
                HF_ERROR("[SESSION] Supervisor poll failed: " << ex.what());
            }
            std::unique_lock<std::mutex> lock(wake_mutex_);
            if (wake_cv_.wait_for(lock, config_.tick, [this] { return stop_requested_; })) {
                break;
            }
        }
        HF_DEBUG("[SESSION] Scheduler stopped");
    }
};

} // namespace hashfeed::core
