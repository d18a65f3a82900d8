#pragma once

#include <string>
#include <string_view>

#include "hashfeed/core/topic.hpp"


namespace hashfeed::core {

// Feed payload format: "<username>: <message>" (UTF-8, no extra framing)

enum class PayloadError {
    None = 0,
    MissingUsername,
    EmptyMessage,
};

[[nodiscard]]
inline constexpr std::string_view to_string(PayloadError e) noexcept {
    switch (e) {
    case PayloadError::None:            return "None";
    case PayloadError::MissingUsername: return "MissingUsername";
    case PayloadError::EmptyMessage:    return "EmptyMessage";
    default:                            return "Unknown";
    }
}

// Both fields are trimmed before validation.
[[nodiscard]]
inline PayloadError compose_payload(std::string_view username, std::string_view message, std::string& out) {
    const auto user = detail::trim(username);
    const auto text = detail::trim(message);
    if (user.empty()) {
        return PayloadError::MissingUsername;
    }
    if (text.empty()) {
        return PayloadError::EmptyMessage;
    }
    out.clear();
    out.reserve(user.size() + 2 + text.size());
    out.append(user);
    out.append(": ");
    out.append(text);
    return PayloadError::None;
}

} // namespace hashfeed::core
