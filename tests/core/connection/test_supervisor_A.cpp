/*
===============================================================================
 connection::Supervisor - Group A Unit Tests
===============================================================================

Scope:
------
Lifecycle of the supervisor: start, first connect, stop and destruction.

These tests drive poll() from the test thread; no scheduler is involved.

Covered Requirements:
---------------------
A1. Nothing happens before start()
A2. start() + poll() connects on a fresh transport
    - Connected signal, epoch 1, endpoint forwarded
A3. start() while active returns InvalidState
A4. stop() closes the transport and emits Stopped exactly once
    - Idempotent
A5. start() after stop() returns InvalidState (terminal)
A6. Destruction closes the live transport

===============================================================================
*/

#include <iostream>

#include "common/harness/supervisor.hpp"


// -----------------------------------------------------------------------------
// A1. Nothing happens before start()
// -----------------------------------------------------------------------------
void test_idle_before_start() {
    std::cout << "[TEST] Group A1: poll() before start() is a no-op\n";
    test::harness::Supervisor h;

    h.supervisor->poll();
    h.drain_signals();

    TEST_CHECK(h.supervisor->state() == connection::State::Disconnected);
    TEST_CHECK(TransportUnderTest::instances_created() == 0);
    TEST_CHECK(TransportUnderTest::connect_calls() == 0);
    TEST_CHECK(h.signals.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A2. start() + poll() connects
// -----------------------------------------------------------------------------
void test_start_connects() {
    std::cout << "[TEST] Group A2: start() + poll() reaches Connected\n";
    test::harness::Supervisor h;

    TEST_CHECK(h.supervisor->start() == transport::ConnectError::None);
    // The attempt itself runs on poll()
    TEST_CHECK(h.supervisor->state() == connection::State::Connecting);
    TEST_CHECK(TransportUnderTest::connect_calls() == 0);

    h.supervisor->poll();
    h.drain_signals();

    TEST_CHECK(h.supervisor->state() == connection::State::Connected);
    TEST_CHECK(h.connect_signals == 1);
    TEST_CHECK(h.retry_schedule_signals == 0);
    TEST_CHECK(h.supervisor->epoch() == 1);
    TEST_CHECK(TransportUnderTest::instances_created() == 1);
    TEST_CHECK(h.supervisor->current_transport() != nullptr);
    TEST_CHECK(h.supervisor->current_transport()->is_connected());
    TEST_CHECK(TransportUnderTest::last_endpoint().host == "broker.test");
    TEST_CHECK(TransportUnderTest::last_endpoint().port == 1883);
    TEST_CHECK(h.telemetry.connect_attempts_total.load() == 1);
    TEST_CHECK(h.telemetry.connect_success_total.load() == 1);

    // Further polls keep the same connection
    h.supervisor->poll();
    h.drain_signals();
    TEST_CHECK(h.connect_signals == 1);
    TEST_CHECK(TransportUnderTest::instances_created() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A3. start() while active
// -----------------------------------------------------------------------------
void test_start_while_active() {
    std::cout << "[TEST] Group A3: start() while active returns InvalidState\n";
    test::harness::Supervisor h;

    h.start_and_poll();
    TEST_CHECK(h.supervisor->state() == connection::State::Connected);

    TEST_CHECK(h.supervisor->start() == transport::ConnectError::InvalidState);
    TEST_CHECK(h.supervisor->state() == connection::State::Connected);
    TEST_CHECK(TransportUnderTest::instances_created() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A4. stop() closes and emits Stopped once
// -----------------------------------------------------------------------------
void test_stop_closes_transport() {
    std::cout << "[TEST] Group A4: stop() closes the transport, emits Stopped once\n";
    test::harness::Supervisor h;

    h.start_and_poll();
    TEST_CHECK(TransportUnderTest::close_calls() == 0);

    h.supervisor->stop();
    h.drain_signals();

    TEST_CHECK(h.supervisor->state() == connection::State::Disconnected);
    TEST_CHECK(h.supervisor->is_stopped());
    TEST_CHECK(h.supervisor->current_transport() == nullptr);
    TEST_CHECK(TransportUnderTest::close_calls() == 1);
    TEST_CHECK(h.stopped_signals == 1);
    // Explicit stop is not a connection loss
    TEST_CHECK(h.disconnect_signals == 0);

    // Idempotent
    h.supervisor->stop();
    h.drain_signals();
    TEST_CHECK(h.stopped_signals == 1);
    TEST_CHECK(TransportUnderTest::close_calls() == 1);
    TEST_CHECK(h.telemetry.stop_calls_total.load() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A5. start() after stop()
// -----------------------------------------------------------------------------
void test_start_after_stop() {
    std::cout << "[TEST] Group A5: start() after stop() returns InvalidState\n";
    test::harness::Supervisor h;

    h.start_and_poll();
    h.supervisor->stop();

    TEST_CHECK(h.supervisor->start() == transport::ConnectError::InvalidState);
    h.supervisor->poll();
    TEST_CHECK(h.supervisor->state() == connection::State::Disconnected);
    TEST_CHECK(TransportUnderTest::instances_created() == 1);

    // Stop before ever starting is terminal too
    h.make_supervisor();
    h.supervisor->stop();
    TEST_CHECK(h.supervisor->start() == transport::ConnectError::InvalidState);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A6. Destruction closes the live transport
// -----------------------------------------------------------------------------
void test_destructor_closes_transport() {
    std::cout << "[TEST] Group A6: destroying the supervisor closes the transport\n";
    test::harness::Supervisor h;

    h.start_and_poll();
    TEST_CHECK(TransportUnderTest::close_calls() == 0);

    h.destroy_supervisor();

    TEST_CHECK(TransportUnderTest::close_calls() == 1);
    TEST_CHECK(!TransportUnderTest::has_live_instance());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "hashfeed/log/logger.hpp"

int main() {
    hashfeed::log::Logger::instance().set_level(hashfeed::log::Level::Trace);

    test_idle_before_start();
    test_start_connects();
    test_start_while_active();
    test_stop_closes_transport();
    test_start_after_stop();
    test_destructor_closes_transport();

    std::cout << "\n[GROUP A - SUPERVISOR LIFECYCLE TESTS PASSED]\n";
    return 0;
}
