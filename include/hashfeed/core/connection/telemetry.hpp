#pragma once

#include <ostream>
#include <type_traits>

#include "hashfeed/core/transport/telemetry.hpp"
#include "hashfeed/metrics/counter.hpp"
#include "hashfeed/format.hpp"

namespace hashfeed::core::connection::telemetry {

// ============================================================================
// Supervisor Telemetry
//
// Observes supervisor-level state transitions and decisions.
// Does NOT duplicate transport telemetry (carried as a sub-structure).
// Mechanical facts only.
// ============================================================================

struct alignas(64) Supervisor final {
    // ---------------------------------------------------------------------
    // Lifecycle & state transitions
    // ---------------------------------------------------------------------

    // start() / stop() invoked by user
    metrics::counter32 start_calls_total;
    metrics::counter32 stop_calls_total;

    // Transport connect() issued
    metrics::counter32 connect_attempts_total;

    // Reached State::Connected
    metrics::counter32 connect_success_total;

    // connect() returned an error
    metrics::counter32 connect_failure_total;

    // Unsolicited disconnects observed (while Connected or replaying)
    metrics::counter32 disconnect_events_total;

    // ---------------------------------------------------------------------
    // Retry & replay
    // ---------------------------------------------------------------------

    // Entered State::Backoff
    metrics::counter32 retry_cycles_started_total;

    // Subscriptions re-established during replay
    metrics::counter64 replay_subscriptions_total;

    // Replay subscribe attempts that failed (retried or given up)
    metrics::counter64 replay_failures_total;

    // Topics given up on after all replay attempts
    metrics::counter64 replay_degraded_total;

    // ---------------------------------------------------------------------
    // Facade gating
    // ---------------------------------------------------------------------

    metrics::counter64 publish_calls_total;

    // publish() rejected before reaching the transport
    metrics::counter64 publish_rejected_total;

    metrics::counter64 subscribe_calls_total;
    metrics::counter64 unsubscribe_calls_total;

    // ---------------------------------------------------------------------
    // Signals
    // ---------------------------------------------------------------------

    // Signals lost because the user is not draining poll_signal()
    metrics::counter32 signals_dropped_total;

    // ---------------------------------------------------------------------
    // Sub-telemetry
    // ---------------------------------------------------------------------

    transport::telemetry::Transport transport;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Supervisor& other) const noexcept {
        start_calls_total.copy_to(other.start_calls_total);
        stop_calls_total.copy_to(other.stop_calls_total);
        connect_attempts_total.copy_to(other.connect_attempts_total);
        connect_success_total.copy_to(other.connect_success_total);
        connect_failure_total.copy_to(other.connect_failure_total);
        disconnect_events_total.copy_to(other.disconnect_events_total);

        retry_cycles_started_total.copy_to(other.retry_cycles_started_total);
        replay_subscriptions_total.copy_to(other.replay_subscriptions_total);
        replay_failures_total.copy_to(other.replay_failures_total);
        replay_degraded_total.copy_to(other.replay_degraded_total);

        publish_calls_total.copy_to(other.publish_calls_total);
        publish_rejected_total.copy_to(other.publish_rejected_total);
        subscribe_calls_total.copy_to(other.subscribe_calls_total);
        unsubscribe_calls_total.copy_to(other.unsubscribe_calls_total);

        signals_dropped_total.copy_to(other.signals_dropped_total);

        // Sub-telemetry
        transport.copy_to(other.transport);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Supervisor Telemetry ===\n";

        os << "Lifecycle\n";
        os << "  Start calls           : " << format_number_exact(start_calls_total.load()) << '\n';
        os << "  Stop calls            : " << format_number_exact(stop_calls_total.load()) << '\n';
        os << "  Connect attempts      : " << format_number_exact(connect_attempts_total.load()) << '\n';
        os << "  Connect success       : " << format_number_exact(connect_success_total.load()) << '\n';
        os << "  Connect failure       : " << format_number_exact(connect_failure_total.load()) << '\n';
        os << "  Disconnect events     : " << format_number_exact(disconnect_events_total.load()) << '\n';

        os << "\nRetry & replay\n";
        os << "  Retry cycles started  : " << format_number_exact(retry_cycles_started_total.load()) << '\n';
        os << "  Replayed subscriptions: " << format_number_exact(replay_subscriptions_total.load()) << '\n';
        os << "  Replay failures       : " << format_number_exact(replay_failures_total.load()) << '\n';
        os << "  Replay degraded       : " << format_number_exact(replay_degraded_total.load()) << '\n';

        os << "\nFacade\n";
        os << "  Publish calls         : " << format_number_exact(publish_calls_total.load()) << '\n';
        os << "  Publish rejected      : " << format_number_exact(publish_rejected_total.load()) << '\n';
        os << "  Subscribe calls       : " << format_number_exact(subscribe_calls_total.load()) << '\n';
        os << "  Unsubscribe calls     : " << format_number_exact(unsubscribe_calls_total.load()) << '\n';

        os << "\nSignals\n";
        os << "  Signals dropped       : " << format_number_exact(signals_dropped_total.load()) << '\n';

        transport.debug_dump(os);
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Supervisor>, "telemetry::Supervisor must be standard layout");
static_assert(std::is_trivially_destructible_v<Supervisor>, "telemetry::Supervisor must be trivially destructible");
static_assert(!std::is_polymorphic_v<Supervisor>, "telemetry::Supervisor must not be polymorphic");
static_assert(alignof(Supervisor) == 64, "telemetry::Supervisor must be cache-line aligned");

} // namespace hashfeed::core::connection::telemetry
