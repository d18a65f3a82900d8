#pragma once

#include <chrono>
#include <cstddef>

#include "hashfeed/core/config/defaults.hpp"
#include "hashfeed/core/connection/config.hpp"
#include "hashfeed/core/delivery/overflow_policy.hpp"
#include "hashfeed/core/transport/endpoint.hpp"


namespace hashfeed::core {

// -----------------------------------------------------------------------------
// SessionConfig
// -----------------------------------------------------------------------------
//
// Everything a core::Session needs at construction. Immutable afterwards.
// Default-constructed values point at the public test broker.
// -----------------------------------------------------------------------------
struct SessionConfig {
    transport::Endpoint endpoint{};

    // Connect timeout, backoff floor/ceiling, replay attempts
    connection::Config connection{};

    std::size_t queue_capacity{config::DELIVERY_QUEUE_CAPACITY};
    delivery::OverflowPolicy overflow_policy{delivery::OverflowPolicy::DropOldest};

    // Larger publishes are refused with PublishError::PayloadTooLarge
    std::size_t max_payload{config::MAX_PAYLOAD_SIZE};

    // Scheduler period when nothing wakes it earlier
    std::chrono::milliseconds tick{config::SUPERVISOR_TICK};
};

} // namespace hashfeed::core
