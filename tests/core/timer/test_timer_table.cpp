/*
===============================================================================
 timer::Table - Unit Tests
===============================================================================

Scope:
------
Per-kind deadline slots tagged with a connection generation.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

1. arm() of a kind replaces the previous instance of that kind
2. Timers fire only once their deadline is reached, earliest first
3. Timers of another generation are discarded, never reported
4. cancel() / cancel_all() disarm

===============================================================================
*/

#include <chrono>
#include <iostream>

#include "pulselink/core/timer/table.hpp"
#include "common/manual_clock.hpp"
#include "common/test_check.hpp"

using namespace pulselink::core;
using namespace std::chrono_literals;


void test_arm_replaces_same_kind() {
    std::cout << "[TEST] timer arm() replaces previous instance of the kind\n";

    test::ManualClock clock;
    timer::Table timers;

    timers.arm(timer::Kind::Heartbeat, clock.now() + 10ms, 1);
    timers.arm(timer::Kind::Heartbeat, clock.now() + 50ms, 1);

    TEST_CHECK(timers.armed_count() == 1);
    TEST_CHECK(timers.deadline(timer::Kind::Heartbeat) == clock.now() + 50ms);

    // The first deadline no longer fires
    clock.advance(20ms);
    timer::Kind kind;
    TEST_CHECK(!timers.pop_expired(clock.now(), 1, kind));

    clock.advance(30ms);
    TEST_CHECK(timers.pop_expired(clock.now(), 1, kind));
    TEST_CHECK(kind == timer::Kind::Heartbeat);
    TEST_CHECK(!timers.armed(timer::Kind::Heartbeat));

    std::cout << "[TEST] OK\n";
}

void test_expiry_order() {
    std::cout << "[TEST] timer expiry reports earliest deadline first\n";

    test::ManualClock clock;
    timer::Table timers;

    timers.arm(timer::Kind::ReconnectDelay, clock.now() + 30ms, 7);
    timers.arm(timer::Kind::ConnectTimeout, clock.now() + 10ms, 7);

    clock.advance(100ms);

    timer::Kind kind;
    TEST_CHECK(timers.pop_expired(clock.now(), 7, kind));
    TEST_CHECK(kind == timer::Kind::ConnectTimeout);
    TEST_CHECK(timers.pop_expired(clock.now(), 7, kind));
    TEST_CHECK(kind == timer::Kind::ReconnectDelay);
    TEST_CHECK(!timers.pop_expired(clock.now(), 7, kind));
    TEST_CHECK(timers.armed_count() == 0);

    std::cout << "[TEST] OK\n";
}

void test_stale_generation_discarded() {
    std::cout << "[TEST] timer of a stale generation is discarded\n";

    test::ManualClock clock;
    timer::Table timers;

    timers.arm(timer::Kind::ConnectTimeout, clock.now() + 10ms, 1);
    clock.advance(20ms);

    timer::Kind kind;
    // Current generation moved on: the timer must not be reported
    TEST_CHECK(!timers.pop_expired(clock.now(), 2, kind));
    // ... and it is gone for good
    TEST_CHECK(!timers.armed(timer::Kind::ConnectTimeout));
    TEST_CHECK(!timers.pop_expired(clock.now(), 1, kind));

    std::cout << "[TEST] OK\n";
}

void test_cancel() {
    std::cout << "[TEST] timer cancel() and cancel_all()\n";

    test::ManualClock clock;
    timer::Table timers;

    timers.arm(timer::Kind::ConnectTimeout, clock.now() + 10ms, 1);
    timers.arm(timer::Kind::Heartbeat, clock.now() + 10ms, 1);
    timers.arm(timer::Kind::ReconnectDelay, clock.now() + 10ms, 1);
    TEST_CHECK(timers.armed_count() == 3);

    timers.cancel(timer::Kind::Heartbeat);
    TEST_CHECK(timers.armed_count() == 2);
    TEST_CHECK(!timers.armed(timer::Kind::Heartbeat));

    timers.cancel_all();
    TEST_CHECK(timers.armed_count() == 0);

    clock.advance(20ms);
    timer::Kind kind;
    TEST_CHECK(!timers.pop_expired(clock.now(), 1, kind));

    std::cout << "[TEST] OK\n";
}


int main() {
    test_arm_replaces_same_kind();
    test_expiry_order();
    test_stale_generation_discarded();
    test_cancel();

    std::cout << "\n[TIMER TABLE TESTS PASSED]\n";
    return 0;
}
