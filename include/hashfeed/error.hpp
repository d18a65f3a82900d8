#pragma once

#include <string>
#include <string_view>

#include "hashfeed/core/error.hpp"
#include "hashfeed/core/payload.hpp"
#include "hashfeed/core/topic.hpp"
#include "hashfeed/core/transport/error.hpp"

namespace hashfeed {

/*
===============================================================================
Client Error Model
===============================================================================

Errors returned by the hashtag-level calls of hashfeed::Client. They fold the
core enums (TopicError, PayloadError, PublishError, SubscriptionError) into
one surface suited to applications and command-line tools.

[InvalidHashtag] the hashtag normalized to an empty topic, or contains an
MQTT wildcard ('+' or '#' past the leading '#'). Also returned by a publish
to a wildcard topic. Nothing was sent and the subscription set is unchanged.

[InvalidPayload] empty username or empty message. Nothing was sent.

[Pending] the subscription change was recorded while the session was not
connected and will be applied by the replay after the next reconnect. This is
the expected outcome before the first connection completes.

[NotConnected] publish while the session is not connected. The message was
not sent and will not be retried.

[Rejected] / [Timeout] the broker refused, or did not acknowledge in time, a
subscribe or unsubscribe. A rejected subscription stays recorded and is
retried by the next replay.

[Transport] the broker client failed to hand the message over.
===============================================================================
*/

enum class ErrorCode {
    None,
    InvalidHashtag,
    InvalidPayload,
    Pending,
    NotConnected,
    Rejected,
    Timeout,
    PayloadTooLarge,
    Transport
};

[[nodiscard]]
inline constexpr std::string_view to_string(ErrorCode c) noexcept {
    switch (c) {
    case ErrorCode::None:            return "none";
    case ErrorCode::InvalidHashtag:  return "invalid_hashtag";
    case ErrorCode::InvalidPayload:  return "invalid_payload";
    case ErrorCode::Pending:         return "pending";
    case ErrorCode::NotConnected:    return "not_connected";
    case ErrorCode::Rejected:        return "rejected";
    case ErrorCode::Timeout:         return "timeout";
    case ErrorCode::PayloadTooLarge: return "payload_too_large";
    case ErrorCode::Transport:       return "transport";
    default:                         return "unknown";
    }
}

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message; // Human-readable explanation

    [[nodiscard]]
    inline bool ok() const noexcept { return code == ErrorCode::None; }
};


// -----------------------------------------------------------------------------
// Core outcome -> client error
// -----------------------------------------------------------------------------

[[nodiscard]]
inline Error to_error(core::TopicError e, std::string_view hashtag) {
    if (e == core::TopicError::None) {
        return {};
    }
    return {ErrorCode::InvalidHashtag, "invalid hashtag '" + std::string(hashtag) + "' (" + std::string(core::to_string(e)) + ")"};
}

[[nodiscard]]
inline Error to_error(core::PayloadError e) {
    if (e == core::PayloadError::None) {
        return {};
    }
    return {ErrorCode::InvalidPayload, std::string(core::to_string(e))};
}

[[nodiscard]]
inline Error to_error(core::transport::SubscriptionError e, const core::Topic& topic) {
    using core::transport::SubscriptionError;
    switch (e) {
    case SubscriptionError::None:
        return {};
    case SubscriptionError::NotConnected:
        return {ErrorCode::Pending, "not connected, '" + topic.str() + "' applied on reconnect"};
    case SubscriptionError::Timeout:
        return {ErrorCode::Timeout, "broker did not acknowledge '" + topic.str() + "'"};
    case SubscriptionError::Rejected:
    default:
        return {ErrorCode::Rejected, "broker rejected '" + topic.str() + "'"};
    }
}

[[nodiscard]]
inline Error to_error(core::PublishError e, const core::Topic& topic) {
    using core::PublishError;
    switch (e) {
    case PublishError::None:
        return {};
    case PublishError::NotConnected:
        return {ErrorCode::NotConnected, "not connected, message to '" + topic.str() + "' not sent"};
    case PublishError::InvalidTopic:
        return {ErrorCode::InvalidHashtag, "wildcards are not allowed in '" + topic.str() + "'"};
    case PublishError::PayloadTooLarge:
        return {ErrorCode::PayloadTooLarge, "message too large"};
    case PublishError::TransportFailure:
    default:
        return {ErrorCode::Transport, "broker client failed to publish to '" + topic.str() + "'"};
    }
}

} // namespace hashfeed
