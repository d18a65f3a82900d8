#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "hashfeed/client.hpp"
#include "hashfeed/core/config/defaults.hpp"
#include "hashfeed/core/transport/endpoint.hpp"

#include "common/cli/validators.hpp"
#include "common/logger.hpp"


namespace hashfeed::cli {

// -------------------------------------------------------------
// Options shared by every tool
// -------------------------------------------------------------
struct BrokerParams {
    std::string broker       = std::string(core::config::DEFAULT_HOST);
    std::uint16_t port       = 0;   // 0: keep the port given in --broker (or the default)
    int keepalive            = static_cast<int>(core::config::DEFAULT_KEEP_ALIVE.count());
    std::string log_level    = "info";

    inline void add_to(CLI::App& app) {
        app.add_option("--broker", broker, "MQTT broker (host[:port], tcp:// or mqtt://)")->check(examples::cli::broker_validator)->default_val(broker);
        app.add_option("--port", port, "Broker port (overrides the port in --broker)")->check(CLI::Range(1, 65535));
        app.add_option("--keepalive", keepalive, "Keep-alive interval in seconds")->check(CLI::Range(1, 3600))->default_val(keepalive);
        app.add_option("-l,--log-level", log_level, "Log level: trace | debug | info | warn | error")->check(examples::cli::log_level_validator)->default_val(log_level);
    }

    [[nodiscard]]
    inline ClientConfig client_config() const {
        ClientConfig cfg;
        const auto err = core::transport::parse_endpoint(broker, cfg.endpoint);
        if (err != core::transport::EndpointError::None) {
            throw std::invalid_argument("invalid broker address '" + broker + "' (" + std::string(core::transport::to_string(err)) + ")");
        }
        if (port != 0) {
            cfg.endpoint.port = port;
        }
        cfg.endpoint.keep_alive = std::chrono::seconds{keepalive};
        return cfg;
    }

    inline void dump(std::ostream& os) const {
        os << "  Broker    : " << client_config().endpoint.uri() << "\n"
           << "  Keepalive : " << keepalive << " s\n"
           << "  Log Level : " << log_level << "\n";
    }
};


// -------------------------------------------------------------
// hashfeed-publish
// -------------------------------------------------------------
struct PublishParams {
    BrokerParams broker;
    std::string hashtag;
    std::string user;
    std::string message;                // empty: one message per stdin line
    int connect_wait_ms = 10000;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n";
        broker.dump(os);
        os << "  Hashtag   : " << hashtag << "\n"
           << "  User      : " << user << "\n"
           << "  Message   : " << (message.empty() ? "<stdin>" : message) << "\n";
    }
};

[[nodiscard]]
inline PublishParams configure_publish(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    PublishParams params{};

    params.broker.add_to(app);
    app.add_option("-t,--tag", params.hashtag, "Hashtag to post under (e.g. -t '#rust')")->required()->check(examples::cli::hashtag_validator);
    app.add_option("-u,--user", params.user, "Username shown in front of the message")->required()->check(examples::cli::username_validator);
    app.add_option("-m,--message", params.message, "Message text (reads stdin lines when omitted)");
    app.add_option("--wait", params.connect_wait_ms, "Milliseconds to wait for the broker connection")->check(CLI::Range(100, 600000))->default_val(params.connect_wait_ms);

    app.footer(
        "Messages are sent as \"<user>: <message>\" to the topic derived from the hashtag.\n"
        "Nothing is queued while disconnected. Ctrl+D or Ctrl+C ends stdin input."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    examples::configure_logging(params.broker.log_level);
    return params;
}


// -------------------------------------------------------------
// hashfeed-follow
// -------------------------------------------------------------
struct FollowParams {
    BrokerParams broker;
    std::vector<std::string> hashtags;
    std::size_t capacity = core::config::DELIVERY_QUEUE_CAPACITY;
    bool drop_newest = false;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n";
        broker.dump(os);
        os << "  Hashtags  : ";
        for (const auto& h : hashtags) {
            os << h << " ";
        }
        os << "\n  Capacity  : " << capacity << (drop_newest ? " (drop newest)" : " (drop oldest)") << "\n";
    }
};

[[nodiscard]]
inline FollowParams configure_follow(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    FollowParams params{};

    params.broker.add_to(app);
    app.add_option("-t,--tag", params.hashtags, "Hashtag(s) to follow at startup (e.g. -t '#rust' -t cpp)")->check(examples::cli::hashtag_validator);
    app.add_option("--capacity", params.capacity, "Inbound messages buffered before dropping")->check(CLI::Range(std::size_t{1}, std::size_t{1} << 20))->default_val(params.capacity);
    app.add_flag("--drop-newest", params.drop_newest, "When the buffer is full drop incoming messages instead of the oldest");

    app.footer(
        "Subscriptions survive reconnects. While running, type '+tag' (or 'tag') to follow\n"
        "and '-tag' to unfollow a hashtag. Press Ctrl+C to exit."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    examples::configure_logging(params.broker.log_level);
    return params;
}

} // namespace hashfeed::cli
