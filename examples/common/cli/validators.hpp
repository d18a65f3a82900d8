#pragma once

#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "hashfeed/core/topic.hpp"
#include "hashfeed/core/transport/endpoint.hpp"


namespace hashfeed::examples::cli {

// -------------------------------------------------------------
// Broker address validator
// -------------------------------------------------------------
inline auto broker_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::transport::Endpoint ep;
        const auto err = core::transport::parse_endpoint(value, ep);
        if (err == core::transport::EndpointError::None) {
            return {};
        }
        return "Broker must be host[:port], tcp://host[:port] or mqtt://host[:port] ("
               + std::string(core::transport::to_string(err)) + ")";
    },
    "Broker address validator"
);


// -------------------------------------------------------------
// Hashtag validator
// -------------------------------------------------------------
inline auto hashtag_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::Topic topic;
        switch (core::make_topic_from_hashtag(value, topic)) {
        case core::TopicError::None:
            return {};
        case core::TopicError::Wildcard:
        case core::TopicError::MisplacedWildcard:
            return "Hashtag must not contain '+' or '#' after the leading '#'";
        default:
            return "Hashtag must contain more than '#' and whitespace (e.g. -t '#rust')";
        }
    },
    "Hashtag validator"
);


// -------------------------------------------------------------
// Username validator
// -------------------------------------------------------------
inline auto username_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (!core::detail::trim(value).empty()) {
            return {};
        }
        return "Username must not be empty";
    },
    "Username validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error"});

} // namespace hashfeed::examples::cli
