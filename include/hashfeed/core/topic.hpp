#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <ostream>
#include <utility>

#include "hashfeed/core/config/defaults.hpp"


namespace hashfeed::core {

/*
===============================================================================
 hashfeed::core::Topic
===============================================================================

Routing key a message is published under and subscribers match against.

A Topic is an immutable value. The only way to obtain one is through
Topic::parse() or make_topic_from_hashtag(), both of which enforce:

  - non-empty
  - no leading '/' separator
  - MQTT wildcards only as a whole level: '+' anywhere, '#' last

make_topic_from_hashtag() is stricter: a hashtag never carries a wildcard,
so "#c++" or "C#" are rejected rather than turned into filters the broker
would refuse.

Everything past that point (registry, supervisor, transport) may assume a
valid Topic and never re-validates.
===============================================================================
*/

enum class TopicError {
    None = 0,
    Empty,             // Nothing left after normalization
    LeadingSeparator,  // Starts with '/'
    MisplacedWildcard, // '+' or '#' sharing a level, or '#' not last
    Wildcard,          // Hashtag contains '+' or '#'
};

[[nodiscard]]
inline constexpr std::string_view to_string(TopicError e) noexcept {
    switch (e) {
    case TopicError::None:             return "None";
    case TopicError::Empty:            return "Empty";
    case TopicError::LeadingSeparator: return "LeadingSeparator";
    case TopicError::MisplacedWildcard: return "MisplacedWildcard";
    case TopicError::Wildcard:         return "Wildcard";
    default:                           return "Unknown";
    }
}

class Topic {
public:
    Topic() = default;

    [[nodiscard]]
    static TopicError parse(std::string_view raw, Topic& out) {
        if (raw.empty()) {
            return TopicError::Empty;
        }
        if (raw.front() == '/') {
            return TopicError::LeadingSeparator;
        }
        if (!wildcards_well_placed_(raw)) {
            return TopicError::MisplacedWildcard;
        }
        out.value_.assign(raw);
        return TopicError::None;
    }

    [[nodiscard]]
    inline const std::string& str() const noexcept { return value_; }

    [[nodiscard]]
    inline bool empty() const noexcept { return value_.empty(); }

    // MQTT wildcards are legal in subscriptions but not in published topics
    [[nodiscard]]
    inline bool has_wildcard() const noexcept {
        return value_.find_first_of("+#") != std::string::npos;
    }

    friend bool operator==(const Topic&, const Topic&) = default;

    friend std::ostream& operator<<(std::ostream& os, const Topic& t) {
        return os << t.value_;
    }

private:
    std::string value_;

    [[nodiscard]]
    static bool wildcards_well_placed_(std::string_view raw) noexcept {
        std::size_t begin = 0;
        for (;;) {
            const auto end = raw.find('/', begin);
            const auto level = raw.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);
            if (level.find_first_of("+#") != std::string_view::npos) {
                if (level.size() != 1) {
                    return false;
                }
                if (level.front() == '#' && end != std::string_view::npos) {
                    return false;
                }
            }
            if (end == std::string_view::npos) {
                return true;
            }
            begin = end + 1;
        }
    }
};


// ---------------------------------------------------------------------
// Hashtag normalization
// ---------------------------------------------------------------------
//
//   "  #Test  "  -> "twitter/Test"
//   "rust"       -> "twitter/rust"
//   "#"          -> ""              (rejected by callers)
//   "#c++"       -> "twitter/c++"   (rejected: wildcard in the tag)
//
// Surrounding whitespace is trimmed, exactly one leading '#' is removed,
// the remainder is trimmed again and prefixed with the namespace segment.
// ---------------------------------------------------------------------

namespace detail {

inline constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

[[nodiscard]]
inline std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

} // namespace detail

[[nodiscard]]
inline std::string normalize_topic(std::string_view raw_hashtag,
                                   std::string_view ns = config::TOPIC_NAMESPACE) {
    std::string_view tag = detail::trim(raw_hashtag);
    if (!tag.empty() && tag.front() == '#') {
        tag = detail::trim(tag.substr(1));
    }
    if (tag.empty()) {
        return {};
    }
    std::string out;
    out.reserve(ns.size() + 1 + tag.size());
    out.append(ns);
    out.push_back('/');
    out.append(tag);
    return out;
}

// True if the tag part of a hashtag would form an MQTT wildcard
[[nodiscard]]
inline bool hashtag_has_wildcard(std::string_view raw_hashtag) noexcept {
    std::string_view tag = detail::trim(raw_hashtag);
    if (!tag.empty() && tag.front() == '#') {
        tag.remove_prefix(1);
    }
    return tag.find_first_of("+#") != std::string_view::npos;
}

// Normalize a hashtag and validate the result as a Topic in one step
[[nodiscard]]
inline TopicError make_topic_from_hashtag(std::string_view raw_hashtag, Topic& out,
                                          std::string_view ns = config::TOPIC_NAMESPACE) {
    if (hashtag_has_wildcard(raw_hashtag)) {
        return TopicError::Wildcard;
    }
    return Topic::parse(normalize_topic(raw_hashtag, ns), out);
}

} // namespace hashfeed::core


template <>
struct std::hash<hashfeed::core::Topic> {
    std::size_t operator()(const hashfeed::core::Topic& t) const noexcept {
        return std::hash<std::string>{}(t.str());
    }
};
