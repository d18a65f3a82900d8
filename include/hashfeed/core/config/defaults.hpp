/*
================================================================================
hashfeed compile-time defaults
================================================================================

Values used when the caller does not override them through core::SessionConfig
or the command line. The broker defaults point at the public Mosquitto test
broker, which is what the hashtag feed tools talk to out of the box.
================================================================================
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>


namespace hashfeed::core::config {

// --- Broker endpoint ----------------------------------------------------------
inline constexpr std::string_view DEFAULT_HOST = "test.mosquitto.org";
inline constexpr std::uint16_t    DEFAULT_PORT = 1883;
inline constexpr std::chrono::seconds DEFAULT_KEEP_ALIVE{60};
inline constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{5000};

// Timeout for a single subscribe / unsubscribe round trip
inline constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{3000};

// --- Topic naming -------------------------------------------------------------
// Namespace segment prefixed to every hashtag-derived topic
inline constexpr std::string_view TOPIC_NAMESPACE = "twitter";

// --- Reconnect policy ---------------------------------------------------------
inline constexpr std::chrono::milliseconds BACKOFF_FLOOR{500};
inline constexpr std::chrono::milliseconds BACKOFF_CEILING{30000};

// Attempts per topic when replaying subscriptions after a reconnect
inline constexpr int REPLAY_ATTEMPTS = 3;

// --- Delivery -----------------------------------------------------------------
inline constexpr std::size_t DELIVERY_QUEUE_CAPACITY = 1024;

// MQTT hard limit for a PUBLISH payload (remaining length field)
inline constexpr std::size_t MAX_PAYLOAD_SIZE = 268435455;

// --- Scheduling ---------------------------------------------------------------
// Period of the supervisor thread when nothing wakes it earlier
inline constexpr std::chrono::milliseconds SUPERVISOR_TICK{10};

// Capacity of the supervisor signal ring (power of two)
inline constexpr std::size_t SIGNAL_RING_CAPACITY = 64;

// Capacity of a transport's control event ring (power of two)
inline constexpr std::size_t TRANSPORT_EVENT_RING_CAPACITY = 16;

} // namespace hashfeed::core::config
