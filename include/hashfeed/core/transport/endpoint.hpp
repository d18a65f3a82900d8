#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "hashfeed/core/config/defaults.hpp"


namespace hashfeed::core::transport {

// Broker endpoint: configuration input, never negotiated
struct Endpoint {
    std::string host{config::DEFAULT_HOST};
    std::uint16_t port{config::DEFAULT_PORT};
    std::chrono::seconds keep_alive{config::DEFAULT_KEEP_ALIVE};

    // Server URI in the form expected by the MQTT client library
    [[nodiscard]]
    inline std::string uri() const {
        return "tcp://" + host + ":" + std::to_string(port);
    }
};

enum class EndpointError {
    None = 0,
    UnsupportedScheme,
    MissingHost,
    InvalidPort,
};

[[nodiscard]]
inline constexpr std::string_view to_string(EndpointError e) noexcept {
    switch (e) {
    case EndpointError::None:              return "None";
    case EndpointError::UnsupportedScheme: return "UnsupportedScheme";
    case EndpointError::MissingHost:       return "MissingHost";
    case EndpointError::InvalidPort:       return "InvalidPort";
    default:                               return "Unknown";
    }
}

// ---------------------------------------------------------------------
// Minimal broker address parser
//
// Accepted inputs:
//   test.mosquitto.org
//   test.mosquitto.org:1883
//   tcp://broker.local:1884
//   mqtt://broker.local
//
// Any other scheme (ssl://, ws://, ...) is rejected: TLS and websockets
// are not handled by this client. keep_alive in `out` is left untouched.
// ---------------------------------------------------------------------
[[nodiscard]]
inline EndpointError parse_endpoint(std::string_view address, Endpoint& out) {
    constexpr std::string_view tcp  = "tcp://";
    constexpr std::string_view mqtt = "mqtt://";

    // 1) Strip optional scheme
    if (address.substr(0, tcp.size()) == tcp) {
        address.remove_prefix(tcp.size());
    }
    else if (address.substr(0, mqtt.size()) == mqtt) {
        address.remove_prefix(mqtt.size());
    }
    else if (address.find("://") != std::string_view::npos) {
        return EndpointError::UnsupportedScheme;
    }
    // 2) Drop a trailing '/' (tcp://host:1883/)
    if (!address.empty() && address.back() == '/') {
        address.remove_suffix(1);
    }
    // 3) Split host and port
    std::string_view host = address;
    std::string_view port;
    const auto colon = address.rfind(':');
    if (colon != std::string_view::npos) {
        host = address.substr(0, colon);
        port = address.substr(colon + 1);
        if (port.empty()) {
            return EndpointError::InvalidPort;
        }
    }
    if (host.empty() || host.find('/') != std::string_view::npos) {
        return EndpointError::MissingHost;
    }
    // 4) Validate port - numeric and in range
    unsigned long p = config::DEFAULT_PORT;
    if (!port.empty()) {
        if (port.size() > 5) {
            return EndpointError::InvalidPort;
        }
        for (char c : port) {
            if (c < '0' || c > '9') {
                return EndpointError::InvalidPort;
            }
        }
        p = std::strtoul(std::string(port).c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return EndpointError::InvalidPort;
        }
    }
    out.host.assign(host);
    out.port = static_cast<std::uint16_t>(p);
    return EndpointError::None;
}

} // namespace hashfeed::core::transport
