/*
===============================================================================
 log::Logger Unit Tests
===============================================================================

Scope:
------
Level filtering and failure behavior of the process-wide logger.

Covered Requirements:
---------------------
L1. Records below the configured level are not written
L2. A failing sink never throws out of Logger::log() or the HF_* macros,
    including from a noexcept caller; the record is counted as dropped
L3. level_from_string() maps unknown names to Info

===============================================================================
*/

#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>

#include "hashfeed/log/logger.hpp"
#include "common/test_check.hpp"

using namespace hashfeed::log;


namespace {

// Sink that rejects every character
class FailingBuf final : public std::streambuf {
protected:
    int_type overflow(int_type) override {
        return traits_type::eof();
    }
};

void log_from_noexcept(int n) noexcept {
    HF_ERROR("[TEST] record " << n);
}

} // namespace


// -----------------------------------------------------------------------------
// L1. Level filtering
// -----------------------------------------------------------------------------
void test_level_filter() {
    std::cout << "[TEST] Group L1: level filtering\n";
    auto& logger = Logger::instance();
    std::ostringstream out;
    logger.set_output(&out);
    logger.enable_color(false);
    logger.set_level(Level::Warn);

    HF_INFO("hidden");
    HF_WARN("shown " << 42);

    const auto text = out.str();
    TEST_CHECK(text.find("hidden") == std::string::npos);
    TEST_CHECK(text.find("[WARN] shown 42") != std::string::npos);

    logger.set_output(&std::cout);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L2. Failing sink
// -----------------------------------------------------------------------------
void test_failing_sink() {
    std::cout << "[TEST] Group L2: a failing sink drops records instead of throwing\n";
    auto& logger = Logger::instance();
    FailingBuf buf;
    std::ostream sink(&buf);
    sink.exceptions(std::ios::badbit | std::ios::failbit);
    logger.set_output(&sink);
    logger.set_level(Level::Trace);

    const auto before = logger.dropped_records();
    logger.log(Level::Error, "direct");
    log_from_noexcept(1);
    log_from_noexcept(2);
    TEST_CHECK(logger.dropped_records() == before + 3);

    logger.set_output(&std::cout);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L3. Level names
// -----------------------------------------------------------------------------
void test_level_names() {
    std::cout << "[TEST] Group L3: level names\n";

    static_assert(level_from_string("trace") == Level::Trace);
    static_assert(level_from_string("fatal") == Level::Fatal);
    TEST_CHECK(level_from_string("verbose") == Level::Info);
    TEST_CHECK(level_from_string("") == Level::Info);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_level_filter();
    test_failing_sink();
    test_level_names();

    std::cout << "\n[LOGGER TESTS PASSED]\n";
    return 0;
}
