// ============================================================================
// hashfeed-publish
//
// Posts messages to a hashtag feed:
// - Connects to the broker and waits for the session to come up
// - Sends "<user>: <message>" to the topic derived from the hashtag
// - Without -m, sends one message per stdin line until EOF or Ctrl+C
//
// Publishing is never queued: a message sent while disconnected is reported
// and skipped.
// ============================================================================

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>

#include "hashfeed.hpp"

#include "common/cli/params.hpp"
#include "common/signal.hpp"

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

namespace {

// Returns true if the message reached the client library
bool publish_one(hashfeed::Client& client, const hashfeed::cli::PublishParams& params, const std::string& message) {
    const hashfeed::Error err = client.publish_hashtag(params.hashtag, params.user, message);
    if (!err.ok()) {
        std::cerr << "[hashfeed-publish] Not sent (" << hashfeed::to_string(err.code) << "): " << err.message << "\n";
        return false;
    }
    std::cout << "[hashfeed-publish] Sent to " << hashfeed::core::normalize_topic(params.hashtag) << "\n";
    return true;
}

} // namespace

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = hashfeed::cli::configure_publish(argc, argv, "hashfeed-publish - post to a hashtag feed");
    params.dump("=== hashfeed-publish ===", std::cout);

    // -------------------------------------------------------------
    // Signal handling
    // -------------------------------------------------------------
    if (!hashfeed::examples::install_interrupt_handler(on_signal)) {
        std::cerr << "[hashfeed-publish] Failed to install the Ctrl+C handler\n";
        return 1;
    }

    // -------------------------------------------------------------
    // Client setup
    // -------------------------------------------------------------
    hashfeed::examples::InterruptsBlocked interrupts_blocked;
    hashfeed::Client client{params.broker.client_config()};

    if (const auto err = client.start(); err != hashfeed::core::transport::ConnectError::None) {
        std::cerr << "[hashfeed-publish] Failed to start (" << hashfeed::core::transport::to_string(err) << ")\n";
        return 1;
    }
    // Ctrl+C now reaches this thread and interrupts the stdin read
    interrupts_blocked.release();

    if (!client.wait_connected(std::chrono::milliseconds{params.connect_wait_ms})) {
        std::cerr << "[hashfeed-publish] Broker " << client.config().endpoint.uri()
                  << " not reachable within " << params.connect_wait_ms << " ms\n";
        client.stop();
        return 1;
    }

    // -------------------------------------------------------------
    // Publish
    // -------------------------------------------------------------
    int failures = 0;
    if (!params.message.empty()) {
        if (!publish_one(client, params, params.message)) {
            ++failures;
        }
    }
    else {
        std::cout << "[hashfeed-publish] Reading messages from stdin (Ctrl+D or Ctrl+C to finish)\n";
        std::string line;
        while (running.load(std::memory_order_relaxed) && std::getline(std::cin, line)) {
            if (hashfeed::core::detail::trim(line).empty()) {
                continue;
            }
            if (!publish_one(client, params, line)) {
                ++failures;
            }
        }
    }

    std::cout << "[hashfeed-publish] Shutting down...\n";
    client.stop();
    return failures == 0 ? 0 : 1;
}
