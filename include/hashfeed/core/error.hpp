#pragma once

#include <string_view>

#include "hashfeed/core/transport/error.hpp"


namespace hashfeed::core {

// ===============================================================
// Session-level publish outcome
// ===============================================================
//
// Publishing is fire-and-forget at QoS 0: None means the transport accepted
// the message, not that any subscriber received it. Nothing is buffered or
// retried on failure.
enum class PublishError {
    None = 0,
    NotConnected,      // Session not Connected; no transport call was made
    InvalidTopic,      // Topic carries an MQTT wildcard ('+' or '#')
    PayloadTooLarge,   // Exceeds the broker protocol limit
    TransportFailure,  // Transport rejected the publish
};

[[nodiscard]]
inline constexpr std::string_view to_string(PublishError e) noexcept {
    switch (e) {
    case PublishError::None:             return "None";
    case PublishError::NotConnected:     return "NotConnected";
    case PublishError::InvalidTopic:     return "InvalidTopic";
    case PublishError::PayloadTooLarge:  return "PayloadTooLarge";
    case PublishError::TransportFailure: return "TransportFailure";
    default:                             return "Unknown";
    }
}

[[nodiscard]]
inline constexpr PublishError to_publish_error(transport::SendError e) noexcept {
    switch (e) {
    case transport::SendError::None:            return PublishError::None;
    case transport::SendError::NotConnected:    return PublishError::NotConnected;
    case transport::SendError::PayloadTooLarge: return PublishError::PayloadTooLarge;
    default:                                    return PublishError::TransportFailure;
    }
}

} // namespace hashfeed::core
