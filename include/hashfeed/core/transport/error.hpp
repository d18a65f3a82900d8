#pragma once

#include <string_view>

namespace hashfeed::core {
namespace transport {

/*
===============================================================================
 transport error classification
===============================================================================

Semantic transport failures, abstracted away from the broker client library's
return codes. One enum per operation so a caller can switch exhaustively on
exactly the outcomes that operation can produce.

All of them:
- have a None member meaning success
- are returned by value, never thrown
- are stable; new values are only appended
===============================================================================
*/

// connect(endpoint, timeout)
enum class ConnectError {
    None = 0,
    Timeout,          // No CONNACK within the connect timeout
    Refused,          // Broker answered and refused the session
    Unreachable,      // DNS, routing or socket failure
    InvalidState,     // connect() on an instance that is already connected
};

// send(topic, payload)
enum class SendError {
    None = 0,
    NotConnected,     // No live connection at call time
    PayloadTooLarge,  // Exceeds the broker protocol limit
    TransportFailure, // Client library rejected the publish
};

// subscribe(topic) / unsubscribe(topic)
enum class SubscriptionError {
    None = 0,
    NotConnected,     // No live connection; desired state is applied on replay
    Timeout,          // No SUBACK/UNSUBACK in time
    Rejected,         // Broker or client library refused the request
};


[[nodiscard]]
inline constexpr std::string_view to_string(ConnectError err) noexcept {
    switch (err) {
    case ConnectError::None:         return "None";
    case ConnectError::Timeout:      return "Timeout";
    case ConnectError::Refused:      return "Refused";
    case ConnectError::Unreachable:  return "Unreachable";
    case ConnectError::InvalidState: return "InvalidState";
    default:                         return "Unknown";
    }
}

[[nodiscard]]
inline constexpr std::string_view to_string(SendError err) noexcept {
    switch (err) {
    case SendError::None:             return "None";
    case SendError::NotConnected:     return "NotConnected";
    case SendError::PayloadTooLarge:  return "PayloadTooLarge";
    case SendError::TransportFailure: return "TransportFailure";
    default:                          return "Unknown";
    }
}

[[nodiscard]]
inline constexpr std::string_view to_string(SubscriptionError err) noexcept {
    switch (err) {
    case SubscriptionError::None:         return "None";
    case SubscriptionError::NotConnected: return "NotConnected";
    case SubscriptionError::Timeout:      return "Timeout";
    case SubscriptionError::Rejected:     return "Rejected";
    default:                              return "Unknown";
    }
}

} // namespace transport
} // namespace hashfeed::core
