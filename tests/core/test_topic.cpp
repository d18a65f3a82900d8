/*
===============================================================================
 Topic / payload Unit Tests
===============================================================================

Scope:
------
Hashtag normalization, topic validation and the feed payload format.

Covered Requirements:
---------------------
T1. "  #Test  " -> "twitter/Test"; bare tags get the namespace prefix
T2. "#" and whitespace-only tags normalize to nothing and are rejected
T3. Topic::parse() rejects empty and leading-'/' topics
T4. Wildcard detection for publish validation
T5. compose_payload() builds "<user>: <message>" and rejects empty fields
T6. Hashtags carrying '+' or '#' past the leading '#' are rejected; topic
    wildcards are accepted only as a whole level

===============================================================================
*/

#include <iostream>
#include <string>
#include <unordered_set>

#include "hashfeed/core/payload.hpp"
#include "hashfeed/core/topic.hpp"
#include "common/test_check.hpp"

using namespace hashfeed::core;


// -----------------------------------------------------------------------------
// T1. Normalization
// -----------------------------------------------------------------------------
void test_normalize_topic() {
    std::cout << "[TEST] Group T1: hashtag normalization\n";

    TEST_CHECK(normalize_topic("  #Test  ") == "twitter/Test");
    TEST_CHECK(normalize_topic("rust") == "twitter/rust");
    TEST_CHECK(normalize_topic("#cpp") == "twitter/cpp");
    TEST_CHECK(normalize_topic("# spaced ") == "twitter/spaced");
    // Only one '#' is stripped
    TEST_CHECK(normalize_topic("##double") == "twitter/#double");
    TEST_CHECK(normalize_topic("news", "mastodon") == "mastodon/news");

    Topic t;
    TEST_CHECK(make_topic_from_hashtag("\t#Test\n", t) == TopicError::None);
    TEST_CHECK(t.str() == "twitter/Test");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// T2. Empty hashtags
// -----------------------------------------------------------------------------
void test_empty_hashtag() {
    std::cout << "[TEST] Group T2: empty hashtags are rejected\n";

    TEST_CHECK(normalize_topic("#").empty());
    TEST_CHECK(normalize_topic("   ").empty());
    TEST_CHECK(normalize_topic("").empty());
    TEST_CHECK(normalize_topic(" #  ").empty());

    Topic t;
    TEST_CHECK(make_topic_from_hashtag("#", t) == TopicError::Empty);
    TEST_CHECK(t.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// T3. Topic validation
// -----------------------------------------------------------------------------
void test_topic_parse() {
    std::cout << "[TEST] Group T3: Topic::parse() validation\n";

    Topic t;
    TEST_CHECK(Topic::parse("", t) == TopicError::Empty);
    TEST_CHECK(Topic::parse("/twitter/a", t) == TopicError::LeadingSeparator);
    TEST_CHECK(Topic::parse("twitter/a", t) == TopicError::None);
    TEST_CHECK(t.str() == "twitter/a");

    Topic same;
    TEST_CHECK(Topic::parse("twitter/a", same) == TopicError::None);
    TEST_CHECK(t == same);

    std::unordered_set<Topic> set{t, same};
    TEST_CHECK(set.size() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// T4. Wildcards
// -----------------------------------------------------------------------------
void test_wildcards() {
    std::cout << "[TEST] Group T4: wildcard detection\n";

    Topic t;
    TEST_CHECK(Topic::parse("twitter/+", t) == TopicError::None);
    TEST_CHECK(t.has_wildcard());
    TEST_CHECK(Topic::parse("twitter/#", t) == TopicError::None);
    TEST_CHECK(t.has_wildcard());
    TEST_CHECK(Topic::parse("twitter/plain", t) == TopicError::None);
    TEST_CHECK(!t.has_wildcard());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// T5. Payload format
// -----------------------------------------------------------------------------
void test_compose_payload() {
    std::cout << "[TEST] Group T5: payload format\n";

    std::string out;
    TEST_CHECK(compose_payload("alice", "hello world", out) == PayloadError::None);
    TEST_CHECK(out == "alice: hello world");

    TEST_CHECK(compose_payload("  bob ", " hi  ", out) == PayloadError::None);
    TEST_CHECK(out == "bob: hi");

    TEST_CHECK(compose_payload("", "text", out) == PayloadError::MissingUsername);
    TEST_CHECK(compose_payload("   ", "text", out) == PayloadError::MissingUsername);
    TEST_CHECK(compose_payload("alice", "", out) == PayloadError::EmptyMessage);
    TEST_CHECK(compose_payload("alice", " \t ", out) == PayloadError::EmptyMessage);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// T6. Wildcards in hashtags and misplaced wildcards
// -----------------------------------------------------------------------------
void test_invalid_filters() {
    std::cout << "[TEST] Group T6: hashtags never become invalid MQTT filters\n";

    Topic t;
    TEST_CHECK(make_topic_from_hashtag("#c++", t) == TopicError::Wildcard);
    TEST_CHECK(make_topic_from_hashtag("##rust", t) == TopicError::Wildcard);
    TEST_CHECK(make_topic_from_hashtag("C#", t) == TopicError::Wildcard);
    TEST_CHECK(make_topic_from_hashtag("+", t) == TopicError::Wildcard);
    TEST_CHECK(t.empty());
    TEST_CHECK(hashtag_has_wildcard(" #a+b "));
    TEST_CHECK(!hashtag_has_wildcard(" #cpp "));

    TEST_CHECK(Topic::parse("twitter/c++", t) == TopicError::MisplacedWildcard);
    TEST_CHECK(Topic::parse("twitter/#rust", t) == TopicError::MisplacedWildcard);
    TEST_CHECK(Topic::parse("twitter/#/more", t) == TopicError::MisplacedWildcard);
    TEST_CHECK(t.empty());

    TEST_CHECK(Topic::parse("twitter/+/replies", t) == TopicError::None);
    TEST_CHECK(Topic::parse("+/#", t) == TopicError::None);
    TEST_CHECK(Topic::parse("#", t) == TopicError::None);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "hashfeed/log/logger.hpp"

int main() {
    hashfeed::log::Logger::instance().set_level(hashfeed::log::Level::Trace);

    test_normalize_topic();
    test_empty_hashtag();
    test_topic_parse();
    test_wildcards();
    test_compose_payload();
    test_invalid_filters();

    std::cout << "\n[TOPIC AND PAYLOAD TESTS PASSED]\n";
    return 0;
}
