/*
===============================================================================
 Supervisor Test Harness
===============================================================================

Purpose:
--------
Provides a minimal, deterministic harness for testing
hashfeed::core::connection::Supervisor FSM behavior.

Design:
-------
- Telemetry, registry and delivery queue outlive the Supervisor
- Supervisor lifetime is explicit and controllable
- poll() is driven by the test thread only: no scheduler, no sleeps
- Backoff is skipped with force_retry_due() instead of waiting
- Supervisor signals are drained deterministically

===============================================================================
*/
#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "hashfeed/core/connection/config.hpp"
#include "hashfeed/core/connection/signal.hpp"
#include "hashfeed/core/connection/supervisor.hpp"
#include "hashfeed/core/connection/telemetry.hpp"
#include "hashfeed/core/delivery/queue.hpp"
#include "hashfeed/core/subscription/registry.hpp"
#include "hashfeed/core/topic.hpp"
#include "hashfeed/core/transport/endpoint.hpp"
#include "common/mock_transport.hpp"
#include "common/test_check.hpp"

// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace hashfeed::core;

using TransportUnderTest = transport::test::MockTransport;
using SupervisorUnderTest = connection::Supervisor<TransportUnderTest>;


namespace hashfeed::core::test {

// Valid topic or test failure
inline Topic make_topic(std::string_view raw) {
    Topic t;
    TEST_CHECK(Topic::parse(raw, t) == TopicError::None);
    return t;
}

// Small, distinct backoff values so assertions on delays are unambiguous
inline connection::Config test_config() {
    connection::Config cfg;
    cfg.connect_timeout = std::chrono::milliseconds{100};
    cfg.backoff_floor = std::chrono::milliseconds{100};
    cfg.backoff_ceiling = std::chrono::milliseconds{1000};
    cfg.replay_attempts = 3;
    return cfg;
}

namespace harness {

struct Supervisor {
    // -------------------------------------------------------------------------
    // Persistent collaborators (must outlive Supervisor)
    // -------------------------------------------------------------------------
    connection::telemetry::Supervisor telemetry;
    subscription::Registry registry;
    delivery::Queue queue{16};
    transport::Endpoint endpoint{"broker.test", 1883, std::chrono::seconds{30}};

    // -------------------------------------------------------------------------
    // Supervisor under test (explicit lifetime)
    // -------------------------------------------------------------------------
    std::unique_ptr<SupervisorUnderTest> supervisor;

    // -------------------------------------------------------------------------
    // Signal counters
    // -------------------------------------------------------------------------
    std::uint32_t connect_signals{0};
    std::uint32_t disconnect_signals{0};
    std::uint32_t retry_schedule_signals{0};
    std::uint32_t replay_degraded_signals{0};
    std::uint32_t stopped_signals{0};

    // Ordered signal log
    std::vector<connection::Signal> signals;

    explicit Supervisor(const connection::Config& config = test_config()) {
        TransportUnderTest::reset();
        make_supervisor(config);
    }

    inline void make_supervisor(const connection::Config& config = test_config()) {
        supervisor = std::make_unique<SupervisorUnderTest>(endpoint, registry, queue, telemetry, config);
    }

    inline void destroy_supervisor() {
        supervisor.reset(); // ~Supervisor() runs here
    }

    // start() + first poll(): Connected on success
    inline void start_and_poll() {
        TEST_CHECK(supervisor->start() == transport::ConnectError::None);
        supervisor->poll();
        drain_signals();
    }

    // Skips the pending backoff and runs the retry
    inline void retry_now() {
        supervisor->force_retry_due();
        supervisor->poll();
        drain_signals();
    }

    // -------------------------------------------------------------------------
    // Drain all pending supervisor signals
    // -------------------------------------------------------------------------
    inline void drain_signals() noexcept {
        if (!supervisor) {
            return;
        }

        connection::Signal sig;
        while (supervisor->poll_signal(sig)) {
            switch (sig) {
            case connection::Signal::Connected:
                ++connect_signals;
                break;

            case connection::Signal::Disconnected:
                ++disconnect_signals;
                break;

            case connection::Signal::RetryScheduled:
                ++retry_schedule_signals;
                break;

            case connection::Signal::ReplayDegraded:
                ++replay_degraded_signals;
                break;

            case connection::Signal::Stopped:
                ++stopped_signals;
                break;

            case connection::Signal::None:
            default:
                break;
            }

            signals.push_back(sig);
        }
    }

    // Reset counters and signal log (does NOT affect supervisor state)
    inline void reset_counters() noexcept {
        connect_signals = 0;
        disconnect_signals = 0;
        retry_schedule_signals = 0;
        replay_degraded_signals = 0;
        stopped_signals = 0;
        signals.clear();
    }
};

} // namespace harness
} // namespace hashfeed::core::test
