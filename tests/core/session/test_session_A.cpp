/*
===============================================================================
 core::Session - Group A Unit Tests
===============================================================================

Scope:
------
End-to-end behavior of the facade with its scheduler thread running against
MockTransport. Assertions that depend on the scheduler use wait_until().

Covered Requirements:
---------------------
A1. publish() before Connected returns NotConnected and sends nothing
    - Wildcard topics are refused with InvalidTopic
A2. subscribe() before start() is recorded and replayed on connect
A3. publish() while Connected reaches the transport
A4. Inbound messages are delivered in arrival order across topics
A5. After an unsolicited disconnect the session reconnects on its own and
    replays every active topic
A6. While Connected, wildcard topics (InvalidTopic) and payloads above
    max_payload (PayloadTooLarge) are refused without a transport call
A7. is_subscribed() follows subscribe()/unsubscribe() while running; a
    repeated subscribe() keeps a single registry entry

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "hashfeed/core/session.hpp"
#include "common/mock_transport.hpp"
#include "common/test_check.hpp"

using namespace hashfeed::core;
using namespace std::chrono_literals;

using TransportUnderTest = transport::test::MockTransport;
using SessionUnderTest = Session<TransportUnderTest>;
using hashfeed::test::wait_until;


namespace {

SessionConfig test_config() {
    SessionConfig cfg;
    cfg.endpoint.host = "broker.test";
    cfg.connection.connect_timeout = 100ms;
    cfg.connection.backoff_floor = 20ms;
    cfg.connection.backoff_ceiling = 200ms;
    cfg.queue_capacity = 16;
    cfg.tick = 1ms;
    return cfg;
}

Topic make_topic(std::string_view raw) {
    Topic t;
    TEST_CHECK(Topic::parse(raw, t) == TopicError::None);
    return t;
}

} // namespace


// -----------------------------------------------------------------------------
// A1. publish() before Connected
// -----------------------------------------------------------------------------
void test_publish_not_connected() {
    std::cout << "[TEST] Group A1: publish() before Connected is refused\n";
    TransportUnderTest::reset();
    SessionUnderTest session{test_config()};

    TEST_CHECK(session.publish(make_topic("twitter/rust"), "alice: hi") == PublishError::NotConnected);
    TEST_CHECK(session.publish(make_topic("twitter/+"), "alice: hi") == PublishError::InvalidTopic);
    TEST_CHECK(TransportUnderTest::sends().empty());
    TEST_CHECK(TransportUnderTest::instances_created() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A2. Deferred subscribe
// -----------------------------------------------------------------------------
void test_subscribe_before_start() {
    std::cout << "[TEST] Group A2: subscribe() before start() is replayed on connect\n";
    TransportUnderTest::reset();
    SessionUnderTest session{test_config()};

    const Topic a = make_topic("twitter/a");
    const Topic b = make_topic("twitter/b");
    TEST_CHECK(session.subscribe(a) == transport::SubscriptionError::NotConnected);
    TEST_CHECK(session.subscribe(b) == transport::SubscriptionError::NotConnected);
    TEST_CHECK(session.subscriptions().size() == 2);
    TEST_CHECK(TransportUnderTest::subscribe_calls().empty());

    TEST_CHECK(session.start() == transport::ConnectError::None);
    TEST_CHECK(wait_until([&] { return session.state() == connection::State::Connected; }));

    const std::vector<std::string> expected{"twitter/a", "twitter/b"};
    TEST_CHECK(TransportUnderTest::subscribe_calls() == expected);

    connection::Signal sig;
    bool connected_signal = false;
    while (session.poll_signal(sig)) {
        connected_signal = connected_signal || sig == connection::Signal::Connected;
    }
    TEST_CHECK(connected_signal);

    session.stop();

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A3. publish() while Connected
// -----------------------------------------------------------------------------
void test_publish_connected() {
    std::cout << "[TEST] Group A3: publish() while Connected reaches the transport\n";
    TransportUnderTest::reset();
    SessionUnderTest session{test_config()};

    TEST_CHECK(session.start() == transport::ConnectError::None);
    TEST_CHECK(wait_until([&] { return session.state() == connection::State::Connected; }));

    TEST_CHECK(session.publish(make_topic("twitter/rust"), "alice: hello") == PublishError::None);

    const auto sent = TransportUnderTest::sends();
    TEST_CHECK(sent.size() == 1);
    TEST_CHECK(sent[0].topic == "twitter/rust");
    TEST_CHECK(sent[0].payload == "alice: hello");
    TEST_CHECK(session.telemetry().publish_calls_total.load() == 1);
    TEST_CHECK(session.telemetry().publish_rejected_total.load() == 0);

    session.stop();

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A4. Inbound ordering
// -----------------------------------------------------------------------------
void test_inbound_order() {
    std::cout << "[TEST] Group A4: inbound messages keep arrival order\n";
    TransportUnderTest::reset();
    SessionUnderTest session{test_config()};

    TEST_CHECK(session.subscribe(make_topic("twitter/a")) == transport::SubscriptionError::NotConnected);
    TEST_CHECK(session.start() == transport::ConnectError::None);
    TEST_CHECK(wait_until([&] { return session.state() == connection::State::Connected; }));

    TEST_CHECK(TransportUnderTest::deliver("twitter/a", "alice: m1"));
    TEST_CHECK(TransportUnderTest::deliver("twitter/b", "bob: m2"));
    TEST_CHECK(TransportUnderTest::deliver("twitter/a", "carol: m3"));

    std::vector<std::string> got;
    delivery::InboundMessage msg;
    while (got.size() < 3 && session.pop_for(msg, 1s)) {
        got.push_back(msg.topic.str() + " " + msg.payload);
    }

    const std::vector<std::string> expected{"twitter/a alice: m1", "twitter/b bob: m2", "twitter/a carol: m3"};
    TEST_CHECK(got == expected);
    TEST_CHECK(session.dropped() == 0);
    TEST_CHECK(session.pending() == 0);

    session.stop();

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A5. Automatic reconnect
// -----------------------------------------------------------------------------
void test_reconnect_replays() {
    std::cout << "[TEST] Group A5: unsolicited disconnect -> reconnect + replay\n";
    TransportUnderTest::reset();
    SessionUnderTest session{test_config()};

    TEST_CHECK(session.subscribe(make_topic("twitter/a")) == transport::SubscriptionError::NotConnected);
    TEST_CHECK(session.start() == transport::ConnectError::None);
    TEST_CHECK(wait_until([&] { return session.epoch() == 1; }));
    TEST_CHECK(TransportUnderTest::subscribe_count("twitter/a") == 1);

    TEST_CHECK(TransportUnderTest::drop_connection());

    TEST_CHECK(wait_until([&] { return session.epoch() == 2; }));
    TEST_CHECK(session.state() == connection::State::Connected);
    TEST_CHECK(TransportUnderTest::subscribe_count("twitter/a") == 2);
    TEST_CHECK(TransportUnderTest::instances_created() == 2);
    TEST_CHECK(session.last_retry_delay() == 20ms);

    session.stop();

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A6. Publish validation while Connected
// -----------------------------------------------------------------------------
void test_publish_rejections_connected() {
    std::cout << "[TEST] Group A6: invalid publishes never reach the transport\n";
    TransportUnderTest::reset();
    auto cfg = test_config();
    cfg.max_payload = 8;
    SessionUnderTest session{cfg};

    TEST_CHECK(session.start() == transport::ConnectError::None);
    TEST_CHECK(wait_until([&] { return session.state() == connection::State::Connected; }));

    TEST_CHECK(session.publish(make_topic("twitter/+"), "alice: hi") == PublishError::InvalidTopic);
    TEST_CHECK(session.publish(make_topic("twitter/#"), "alice: hi") == PublishError::InvalidTopic);
    TEST_CHECK(session.publish(make_topic("twitter/rust"), "alice: too long") == PublishError::PayloadTooLarge);
    TEST_CHECK(TransportUnderTest::sends().empty());
    TEST_CHECK(session.telemetry().publish_calls_total.load() == 3);
    TEST_CHECK(session.telemetry().publish_rejected_total.load() == 3);

    // Exactly at the limit is accepted
    TEST_CHECK(session.publish(make_topic("twitter/rust"), "alice: x") == PublishError::None);
    TEST_CHECK(TransportUnderTest::sends().size() == 1);

    session.stop();

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A7. Follow / unfollow while running
// -----------------------------------------------------------------------------
void test_follow_unfollow_running() {
    std::cout << "[TEST] Group A7: subscribe/unsubscribe while Connected\n";
    TransportUnderTest::reset();
    SessionUnderTest session{test_config()};

    TEST_CHECK(session.start() == transport::ConnectError::None);
    TEST_CHECK(wait_until([&] { return session.state() == connection::State::Connected; }));

    const Topic rust = make_topic("twitter/rust");
    TEST_CHECK(!session.is_subscribed(rust));

    TEST_CHECK(session.subscribe(rust) == transport::SubscriptionError::None);
    TEST_CHECK(session.is_subscribed(rust));
    TEST_CHECK(session.subscribe(rust) == transport::SubscriptionError::None);
    TEST_CHECK(session.subscriptions().size() == 1);

    TEST_CHECK(session.unsubscribe(rust) == transport::SubscriptionError::None);
    TEST_CHECK(!session.is_subscribed(rust));
    TEST_CHECK(session.subscriptions().empty());

    const std::vector<std::string> unsubscribed{"twitter/rust"};
    TEST_CHECK(TransportUnderTest::unsubscribe_calls() == unsubscribed);

    session.stop();

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "hashfeed/log/logger.hpp"

int main() {
    hashfeed::log::Logger::instance().set_level(hashfeed::log::Level::Trace);

    test_publish_not_connected();
    test_subscribe_before_start();
    test_publish_connected();
    test_inbound_order();
    test_reconnect_replays();
    test_publish_rejections_connected();
    test_follow_unfollow_running();

    std::cout << "\n[GROUP A - SESSION FACADE TESTS PASSED]\n";
    return 0;
}
