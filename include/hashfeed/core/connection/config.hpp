/*
================================================================================
hashfeed Connection Configuration
================================================================================
*/
#pragma once

#include <chrono>

#include "hashfeed/core/config/defaults.hpp"


namespace hashfeed::core::connection {

// Runtime policy of a connection::Supervisor
struct Config {
    // Upper bound for a single connect attempt
    std::chrono::milliseconds connect_timeout{config::DEFAULT_CONNECT_TIMEOUT};

    // Retry delay = floor * 2^n, capped at ceiling
    std::chrono::milliseconds backoff_floor{config::BACKOFF_FLOOR};
    std::chrono::milliseconds backoff_ceiling{config::BACKOFF_CEILING};

    // Subscribe attempts per topic during replay
    int replay_attempts{config::REPLAY_ATTEMPTS};
};

} // namespace hashfeed::core::connection
