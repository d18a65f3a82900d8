// ============================================================================
// hashfeed-follow
//
// Follows one or more hashtag feeds:
// - Subscribes to every -t hashtag (intent is kept across reconnects)
// - Follows / unfollows hashtags typed on stdin: "+tag" or "tag", "-tag"
// - Prints "[YYYY-mm-dd HH:MM:SS] <topic> — <payload>" per message
// - Reports connection state changes and messages lost to overflow
// - Dumps telemetry on Ctrl+C
// ============================================================================

#include <atomic>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <poll.h>
#include <unistd.h>

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

// Local wall-clock time, second resolution
std::string format_time(std::chrono::system_clock::time_point tp) {
    const auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf, n);
}

// Non-blocking line reader over stdin, polled from the main loop
class StdinLines {
public:
    // Appends every complete line available right now
    void poll(std::vector<std::string>& out) {
        if (eof_) {
            return;
        }
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        if (::poll(&pfd, 1, 0) <= 0 || (pfd.revents & (POLLIN | POLLHUP)) == 0) {
            return;
        }
        char buf[4096];
        const auto n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n < 0) {
            eof_ = (errno != EINTR && errno != EAGAIN);
            return;
        }
        if (n == 0) {
            eof_ = true;
            if (!pending_.empty()) {
                out.push_back(std::move(pending_));
                pending_.clear();
            }
            return;
        }
        pending_.append(buf, static_cast<std::size_t>(n));
        std::size_t pos;
        while ((pos = pending_.find('\n')) != std::string::npos) {
            out.push_back(pending_.substr(0, pos));
            pending_.erase(0, pos + 1);
        }
    }

private:
    std::string pending_;
    bool eof_{false};
};

// "#Rust " -> "#Rust"
std::string display_tag(std::string_view raw) {
    auto tag = hashfeed::core::detail::trim(raw);
    if (!tag.empty() && tag.front() == '#') {
        tag = hashfeed::core::detail::trim(tag.substr(1));
    }
    return "#" + std::string(tag);
}

void follow(hashfeed::Client& client, std::string_view hashtag) {
    if (client.is_following(hashtag)) {
        std::cout << "[hashfeed-follow] Already subscribed to " << display_tag(hashtag) << std::endl;
        return;
    }
    const hashfeed::Error err = client.subscribe_hashtag(hashtag);
    if (!err.ok() && err.code != hashfeed::ErrorCode::Pending) {
        std::cerr << "[hashfeed-follow] Subscribe failed (" << hashfeed::to_string(err.code) << "): " << err.message << "\n";
        if (!client.is_following(hashtag)) {
            return;
        }
    }
    std::cout << "[System] Subscribed to " << display_tag(hashtag) << std::endl;
}

void unfollow(hashfeed::Client& client, std::string_view hashtag) {
    if (!client.is_following(hashtag)) {
        std::cout << "[hashfeed-follow] Not subscribed to " << display_tag(hashtag) << std::endl;
        return;
    }
    const hashfeed::Error err = client.unsubscribe_hashtag(hashtag);
    if (!err.ok() && err.code != hashfeed::ErrorCode::Pending) {
        std::cerr << "[hashfeed-follow] Unsubscribe failed (" << hashfeed::to_string(err.code) << "): " << err.message << "\n";
    }
    std::cout << "[System] Unsubscribed from " << display_tag(hashtag) << std::endl;
}

// "+tag" / "tag" follows, "-tag" unfollows
void apply_command(hashfeed::Client& client, std::string_view line) {
    auto cmd = hashfeed::core::detail::trim(line);
    if (cmd.empty()) {
        return;
    }
    const bool remove = cmd.front() == '-';
    if (remove || cmd.front() == '+') {
        cmd.remove_prefix(1);
    }
    hashfeed::core::Topic topic;
    const auto terr = hashfeed::core::make_topic_from_hashtag(cmd, topic);
    if (terr != hashfeed::core::TopicError::None) {
        std::cerr << "[hashfeed-follow] Ignoring '" << line << "': invalid hashtag ("
                  << hashfeed::core::to_string(terr) << ")\n";
        return;
    }
    if (remove) {
        unfollow(client, cmd);
    }
    else {
        follow(client, cmd);
    }
}

void drain_signals(hashfeed::Client& client) {
    using hashfeed::core::connection::Signal;
    Signal sig;
    while (client.poll_signal(sig)) {
        switch (sig) {
            case Signal::Connected:
                std::cout << "[hashfeed-follow] Connected to " << client.config().endpoint.uri() << std::endl;
                break;

            case Signal::Disconnected:
                std::cout << "[hashfeed-follow] Connection lost" << std::endl;
                break;

            case Signal::RetryScheduled:
                std::cout << "[hashfeed-follow] Reconnecting in " << client.last_retry_delay().count() << " ms" << std::endl;
                break;

            case Signal::ReplayDegraded:
                std::cout << "[hashfeed-follow] Could not restore:";
                for (const auto& topic : client.degraded_topics()) {
                    std::cout << " " << topic;
                }
                std::cout << std::endl;
                break;

            case Signal::Stopped:
                std::cout << "[hashfeed-follow] Session stopped" << std::endl;
                break;

            default:
                break;
        }
    }
}

} // namespace

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = hashfeed::cli::configure_follow(argc, argv, "hashfeed-follow - print hashtag feeds as they arrive");
    params.dump("=== hashfeed-follow ===", std::cout);

    // -------------------------------------------------------------
    // Signal handling
    // -------------------------------------------------------------
    if (!hashfeed::examples::install_interrupt_handler(on_signal)) {
        std::cerr << "[hashfeed-follow] Failed to install the Ctrl+C handler\n";
        return 1;
    }

    // -------------------------------------------------------------
    // Client setup
    // -------------------------------------------------------------
    hashfeed::ClientConfig cfg = params.broker.client_config();
    cfg.queue_capacity = params.capacity;
    cfg.overflow_policy = params.drop_newest ? hashfeed::core::delivery::OverflowPolicy::DropNewest
                                             : hashfeed::core::delivery::OverflowPolicy::DropOldest;
    hashfeed::Client client{cfg};

    if (const auto err = client.start(); err != hashfeed::core::transport::ConnectError::None) {
        std::cerr << "[hashfeed-follow] Failed to start (" << hashfeed::core::transport::to_string(err) << ")\n";
        return 1;
    }

    // Not connected yet: every hashtag is recorded and applied on connect
    for (const auto& tag : params.hashtags) {
        follow(client, tag);
    }

    std::cout << "[hashfeed-follow] Following " << client.subscriptions().size()
              << " topic(s). Type +tag / -tag to follow or unfollow, Ctrl+C to exit.\n";

    // -------------------------------------------------------------
    // Main loop
    // -------------------------------------------------------------
    std::uint64_t reported_drops = 0;
    StdinLines stdin_lines;
    std::vector<std::string> commands;
    hashfeed::core::delivery::InboundMessage msg;
    while (running.load(std::memory_order_relaxed)) {
        drain_signals(client);

        commands.clear();
        stdin_lines.poll(commands);
        for (const auto& cmd : commands) {
            apply_command(client, cmd);
        }

        if (client.pop_for(msg, std::chrono::milliseconds{200})) {
            std::cout << "[" << format_time(msg.received) << "] " << msg.topic << " — " << msg.payload << std::endl;
        }

        if (const auto dropped = client.dropped(); dropped != reported_drops) {
            std::cout << "[hashfeed-follow] " << (dropped - reported_drops) << " message(s) dropped (output too slow)" << std::endl;
            reported_drops = dropped;
        }
    }

    std::cout << "[hashfeed-follow] Shutting down...\n";
    client.stop();
    drain_signals(client);

    client.dump_telemetry(std::cout);
    std::cout << "[hashfeed-follow] Done.\n";
    return 0;
}
