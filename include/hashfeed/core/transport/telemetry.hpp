#pragma once

#include <ostream>
#include <type_traits>

#include "hashfeed/metrics/counter.hpp"
#include "hashfeed/format.hpp"

namespace hashfeed::core::transport::telemetry {

// ============================================================================
// Transport Telemetry
//
// Broker-client level observability shared by all transport backends.
// Captures ONLY mechanical client behavior: what went over the wire and what
// the I/O callbacks had to swallow. No clocks, no policy.
//
// Written from the broker I/O threads, read from anywhere.
// ============================================================================

struct alignas(64) Transport final {
    // ---------------------------------------------------------------------
    // Throughput (cumulative, monotonic)
    // ---------------------------------------------------------------------

    metrics::counter64 bytes_rx_total;
    metrics::counter64 bytes_tx_total;

    metrics::counter64 messages_rx_total;
    metrics::counter64 messages_tx_total;

    // Inbound messages the delivery queue refused (closed or DropNewest)
    metrics::counter64 messages_rejected_total;

    // ---------------------------------------------------------------------
    // Errors & lifecycle
    // ---------------------------------------------------------------------

    // Exceptions caught at the I/O callback boundary
    metrics::counter32 callback_failures_total;

    // Unsolicited connection losses reported by the client library
    metrics::counter32 connection_lost_total;

    // Control events lost because the event ring was full
    metrics::counter32 events_dropped_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Transport& other) const noexcept {
        bytes_rx_total.copy_to(other.bytes_rx_total);
        bytes_tx_total.copy_to(other.bytes_tx_total);
        messages_rx_total.copy_to(other.messages_rx_total);
        messages_tx_total.copy_to(other.messages_tx_total);
        messages_rejected_total.copy_to(other.messages_rejected_total);

        callback_failures_total.copy_to(other.callback_failures_total);
        connection_lost_total.copy_to(other.connection_lost_total);
        events_dropped_total.copy_to(other.events_dropped_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Transport Telemetry ===\n";

        os << "Throughput\n";
        os << "  Bytes RX              : " << format_bytes(bytes_rx_total.load()) << '\n';
        os << "  Bytes TX              : " << format_bytes(bytes_tx_total.load()) << '\n';
        os << "  Messages RX           : " << format_number_exact(messages_rx_total.load()) << '\n';
        os << "  Messages TX           : " << format_number_exact(messages_tx_total.load()) << '\n';
        os << "  Messages rejected     : " << format_number_exact(messages_rejected_total.load()) << '\n';

        os << "\nErrors & lifecycle\n";
        os << "  Callback failures     : " << format_number_exact(callback_failures_total.load()) << '\n';
        os << "  Connection lost       : " << format_number_exact(connection_lost_total.load()) << '\n';
        os << "  Events dropped        : " << format_number_exact(events_dropped_total.load()) << '\n';
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Transport>, "telemetry::Transport must be standard layout");
static_assert(std::is_trivially_destructible_v<Transport>, "telemetry::Transport must be trivially destructible");
static_assert(!std::is_polymorphic_v<Transport>, "telemetry::Transport must not be polymorphic");
static_assert(alignof(Transport) == 64, "telemetry::Transport must be cache-line aligned");

} // namespace hashfeed::core::transport::telemetry
