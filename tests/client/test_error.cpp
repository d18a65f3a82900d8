/*
===============================================================================
 Client Error Mapping Unit Tests
===============================================================================

Scope:
------
Folding of the core outcome enums into hashfeed::Error, as returned by the
hashtag-level calls of hashfeed::Client.

Covered Requirements:
---------------------
E1. TopicError -> InvalidHashtag, naming the hashtag and the reason
E2. PayloadError -> InvalidPayload
E3. SubscriptionError: NotConnected is Pending, Timeout and Rejected map 1:1
E4. PublishError: every value maps to its client code
E5. None always maps to an ok() error with no message

===============================================================================
*/

#include <iostream>
#include <string>

#include "hashfeed/error.hpp"
#include "common/test_check.hpp"

using namespace hashfeed;


namespace {

core::Topic make_topic(std::string_view raw) {
    core::Topic t;
    TEST_CHECK(core::Topic::parse(raw, t) == core::TopicError::None);
    return t;
}

bool contains(const std::string& s, std::string_view needle) {
    return s.find(needle) != std::string::npos;
}

} // namespace


// -----------------------------------------------------------------------------
// E1. Hashtags
// -----------------------------------------------------------------------------
void test_topic_errors() {
    std::cout << "[TEST] Group E1: hashtag errors\n";

    core::Topic t;
    const auto wildcard = to_error(core::make_topic_from_hashtag("#c++", t), "#c++");
    TEST_CHECK(wildcard.code == ErrorCode::InvalidHashtag);
    TEST_CHECK(contains(wildcard.message, "#c++"));
    TEST_CHECK(contains(wildcard.message, "Wildcard"));

    const auto empty = to_error(core::make_topic_from_hashtag(" # ", t), " # ");
    TEST_CHECK(empty.code == ErrorCode::InvalidHashtag);
    TEST_CHECK(contains(empty.message, "Empty"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E2. Payload
// -----------------------------------------------------------------------------
void test_payload_errors() {
    std::cout << "[TEST] Group E2: payload errors\n";

    std::string payload;
    TEST_CHECK(to_error(core::compose_payload("", "hi", payload)).code == ErrorCode::InvalidPayload);
    TEST_CHECK(to_error(core::compose_payload("alice", " ", payload)).code == ErrorCode::InvalidPayload);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E3. Subscriptions
// -----------------------------------------------------------------------------
void test_subscription_errors() {
    std::cout << "[TEST] Group E3: subscription outcomes\n";
    using core::transport::SubscriptionError;

    const auto topic = make_topic("twitter/rust");

    const auto pending = to_error(SubscriptionError::NotConnected, topic);
    TEST_CHECK(pending.code == ErrorCode::Pending);
    TEST_CHECK(contains(pending.message, "twitter/rust"));

    TEST_CHECK(to_error(SubscriptionError::Timeout, topic).code == ErrorCode::Timeout);
    TEST_CHECK(to_error(SubscriptionError::Rejected, topic).code == ErrorCode::Rejected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E4. Publish
// -----------------------------------------------------------------------------
void test_publish_errors() {
    std::cout << "[TEST] Group E4: publish outcomes\n";
    using core::PublishError;

    const auto topic = make_topic("twitter/+");

    TEST_CHECK(to_error(PublishError::NotConnected, topic).code == ErrorCode::NotConnected);
    TEST_CHECK(to_error(PublishError::InvalidTopic, topic).code == ErrorCode::InvalidHashtag);
    TEST_CHECK(to_error(PublishError::PayloadTooLarge, topic).code == ErrorCode::PayloadTooLarge);
    TEST_CHECK(to_error(PublishError::TransportFailure, topic).code == ErrorCode::Transport);
    TEST_CHECK(contains(to_error(PublishError::InvalidTopic, topic).message, "twitter/+"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E5. Success
// -----------------------------------------------------------------------------
void test_success() {
    std::cout << "[TEST] Group E5: None maps to ok()\n";

    const auto topic = make_topic("twitter/rust");
    const Error errors[] = {
        to_error(core::TopicError::None, "#rust"),
        to_error(core::PayloadError::None),
        to_error(core::transport::SubscriptionError::None, topic),
        to_error(core::PublishError::None, topic),
    };
    for (const auto& e : errors) {
        TEST_CHECK(e.ok());
        TEST_CHECK(e.message.empty());
    }
    TEST_CHECK(to_string(ErrorCode::Pending) == "pending");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_topic_errors();
    test_payload_errors();
    test_subscription_errors();
    test_publish_errors();
    test_success();

    std::cout << "\n[CLIENT ERROR MAPPING TESTS PASSED]\n";
    return 0;
}
