/*
===============================================================================
 connection::Machine - Group B Unit Tests
===============================================================================

Scope:
------
Reconnection after failures: backoff schedule, attempt budget, policy.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

1. Unclean close while Connected -> Reconnecting with attempts == 1, then
   Connecting again once delay(1) has elapsed
2. Retry delays follow min(base * 2^(n-1), max)
3. After max_attempts failed retries -> Disconnected (MaxAttemptsExceeded),
   no timer armed; connect() restarts from attempts == 0
4. Connect timeout fails the attempt
5. connect() while Reconnecting skips the pending delay
6. A forbidden reconnect resolves to Disconnected, immediately or when the
   permission is revoked during the delay
7. Transport errors are handled as failures of the attempt / connection
8. Jittered delays stay within the configured ratio

===============================================================================
*/

#include <iostream>

#include "common/harness/machine.hpp"


// Fails the in-flight attempt with an abnormal close
static void fail_attempt(test::MachineHarness& h) {
    TEST_CHECK(h.machine->state() == State::Connecting);
    h.transport.emit_close(CLOSE_ABNORMAL);
    h.poll();
}

// Time left until the pending retry fires
static std::chrono::milliseconds retry_delay(const test::MachineHarness& h) {
    TEST_CHECK(h.machine->timers().armed(timer::Kind::ReconnectDelay));
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        h.machine->timers().deadline(timer::Kind::ReconnectDelay) - h.clock.now());
}


void test_unclean_close_reconnects() {
    std::cout << "[TEST] Group B1: unclean close -> Reconnecting -> Connecting\n";

    test::MachineHarness h;
    h.connect_and_open();
    h.reset_log();

    h.transport.emit_close(CLOSE_ABNORMAL);
    h.poll();

    TEST_CHECK(h.machine->state() == State::Reconnecting);
    TEST_CHECK(h.machine->reconnect_attempts() == 1);
    TEST_CHECK(h.machine->status().last_error_code == Error::TransportClosed);
    TEST_CHECK(!h.machine->status().last_error.empty());
    TEST_CHECK(!h.machine->status().connection_id.has());
    TEST_CHECK(retry_delay(h) == 5000ms);

    h.advance(4999ms);
    TEST_CHECK(h.machine->state() == State::Reconnecting);
    TEST_CHECK(h.transport.open_calls() == 1);

    h.advance(1ms);
    TEST_CHECK(h.machine->state() == State::Connecting);
    TEST_CHECK(h.transport.open_calls() == 2);
    TEST_CHECK(h.machine->reconnect_attempts() == 1);

    h.transport.emit_open();
    h.poll();
    TEST_CHECK(h.machine->state() == State::Connected);
    TEST_CHECK(h.machine->reconnect_attempts() == 0);
    TEST_CHECK(h.machine->status().last_error.empty());
    TEST_CHECK(h.machine->epoch() == 2);

    TEST_CHECK(h.transitions.size() == 3);
    TEST_CHECK(h.transitions[0].to == State::Reconnecting);
    TEST_CHECK(h.transitions[0].status.reconnect_attempts == 1);
    TEST_CHECK(h.transitions[1].to == State::Connecting);
    TEST_CHECK(h.transitions[1].event == Event::RetryTimerExpired);
    TEST_CHECK(h.transitions[2].to == State::Connected);

    std::cout << "[TEST] OK\n";
}

void test_backoff_schedule_and_exhaustion() {
    std::cout << "[TEST] Group B2: retry schedule and attempt budget\n";

    test::MachineHarness h;
    h.connect_and_open();

    h.transport.emit_close(CLOSE_ABNORMAL);
    h.poll();

    const std::chrono::milliseconds expected[] = {
        5000ms, 10000ms, 20000ms, 30000ms, 30000ms,
        30000ms, 30000ms, 30000ms, 30000ms, 30000ms
    };

    for (std::uint32_t attempt = 1; attempt <= 10; ++attempt) {
        TEST_CHECK(h.machine->state() == State::Reconnecting);
        TEST_CHECK(h.machine->reconnect_attempts() == attempt);
        const auto d = retry_delay(h);
        TEST_CHECK(d == expected[attempt - 1]);

        h.advance(d);
        fail_attempt(h);
    }

    // Budget exhausted
    TEST_CHECK(h.machine->state() == State::Disconnected);
    TEST_CHECK(h.machine->reconnect_attempts() == 10);
    TEST_CHECK(h.machine->status().last_error_code == Error::MaxAttemptsExceeded);
    TEST_CHECK(h.machine->status().last_error == "max reconnect attempts exceeded");
    TEST_CHECK(h.machine->timers().armed_count() == 0);

    const int opens = h.transport.open_calls();
    h.advance(10min);
    TEST_CHECK(h.machine->state() == State::Disconnected);
    TEST_CHECK(h.transport.open_calls() == opens);

    // Manual connect starts a fresh cycle
    TEST_CHECK(h.machine->connect() == Error::None);
    TEST_CHECK(h.machine->reconnect_attempts() == 0);
    h.transport.emit_open();
    h.poll();
    TEST_CHECK(h.machine->state() == State::Connected);
    TEST_CHECK(h.machine->reconnect_attempts() == 0);
    TEST_CHECK(h.machine->status().last_error_code == Error::None);

    std::cout << "[TEST] OK\n";
}

void test_connect_timeout() {
    std::cout << "[TEST] Group B3: connect timeout\n";

    test::MachineHarness h;
    TEST_CHECK(h.machine->connect() == Error::None);

    h.advance(9999ms);
    TEST_CHECK(h.machine->state() == State::Connecting);

    h.advance(1ms);
    TEST_CHECK(h.machine->state() == State::Reconnecting);
    TEST_CHECK(h.machine->status().last_error_code == Error::OpenTimeout);
    TEST_CHECK(h.transport.close_calls() == 1);
    TEST_CHECK(h.transport.last_close_code() == CLOSE_OPEN_TIMEOUT);

    // A late open of the timed-out attempt is ignored
    h.transport.emit_open();
    h.poll();
    TEST_CHECK(h.machine->state() == State::Reconnecting);

    std::cout << "[TEST] OK\n";
}

void test_connect_skips_retry_delay() {
    std::cout << "[TEST] Group B4: connect() while Reconnecting\n";

    test::MachineHarness h;
    h.connect_and_open();
    h.transport.emit_close(CLOSE_ABNORMAL);
    h.poll();
    TEST_CHECK(h.machine->state() == State::Reconnecting);

    TEST_CHECK(h.machine->connect() == Error::None);
    TEST_CHECK(h.machine->state() == State::Connecting);
    TEST_CHECK(h.transport.open_calls() == 2);
    TEST_CHECK(h.machine->reconnect_attempts() == 1);
    TEST_CHECK(!h.machine->timers().armed(timer::Kind::ReconnectDelay));

    // The skipped retry does not fire later
    h.transport.emit_open();
    h.poll();
    h.advance(5s);
    TEST_CHECK(h.machine->state() == State::Connected);
    TEST_CHECK(h.transport.open_calls() == 2);

    std::cout << "[TEST] OK\n";
}

void test_reconnect_not_permitted() {
    std::cout << "[TEST] Group B5: failure while reconnect is not permitted\n";

    test::MachineHarness h;
    h.connect_and_open();
    h.machine->set_reconnect_permitted(false);
    TEST_CHECK(h.machine->state() == State::Connected);

    h.transport.emit_close(CLOSE_ABNORMAL);
    h.poll();

    TEST_CHECK(h.machine->state() == State::Disconnected);
    TEST_CHECK(h.machine->reconnect_attempts() == 0);
    TEST_CHECK(h.machine->status().last_error_code == Error::TransportClosed);
    TEST_CHECK(h.machine->timers().armed_count() == 0);
    TEST_CHECK(h.count_transitions_to(State::Reconnecting) == 0);

    std::cout << "[TEST] OK\n";
}

void test_permission_revoked_while_reconnecting() {
    std::cout << "[TEST] Group B6: permission revoked during the retry delay\n";

    test::MachineHarness h;
    h.connect_and_open();
    h.transport.emit_close(CLOSE_ABNORMAL);
    h.poll();
    TEST_CHECK(h.machine->state() == State::Reconnecting);

    h.machine->set_reconnect_permitted(false);
    h.drain_transitions();

    TEST_CHECK(h.machine->state() == State::Disconnected);
    TEST_CHECK(h.machine->status().last_error_code == Error::ReconnectSuspended);
    TEST_CHECK(h.machine->timers().armed_count() == 0);
    TEST_CHECK(h.transitions.back().event == Event::ReconnectDenied);

    h.advance(1min);
    TEST_CHECK(h.transport.open_calls() == 1);

    // Restoring the permission alone does not reconnect
    h.machine->set_reconnect_permitted(true);
    h.advance(1min);
    TEST_CHECK(h.machine->state() == State::Disconnected);

    std::cout << "[TEST] OK\n";
}

void test_transport_errors() {
    std::cout << "[TEST] Group B7: transport errors\n";

    // While Connecting
    {
        test::MachineHarness h;
        TEST_CHECK(h.machine->connect() == Error::None);
        h.transport.emit_error(Error::TransportOpenFailed);
        h.poll();
        TEST_CHECK(h.machine->state() == State::Reconnecting);
        TEST_CHECK(h.machine->status().last_error_code == Error::TransportOpenFailed);
        TEST_CHECK(h.machine->reconnect_attempts() == 1);
        TEST_CHECK(h.transport.last_close_code() == CLOSE_TRANSPORT_ERROR);
    }
    // While Connected
    {
        test::MachineHarness h;
        h.connect_and_open();
        h.transport.emit_error(Error::TransportClosed);
        h.poll();
        TEST_CHECK(h.machine->state() == State::Reconnecting);
        TEST_CHECK(h.machine->status().last_error_code == Error::TransportClosed);
        TEST_CHECK(h.transport.close_calls() == 1);
        TEST_CHECK(h.transport.last_close_code() == CLOSE_TRANSPORT_ERROR);
    }

    std::cout << "[TEST] OK\n";
}

void test_write_failure() {
    std::cout << "[TEST] Group B8: fail_connection() closes and reconnects\n";

    test::MachineHarness h;
    h.connect_and_open();

    h.machine->fail_connection(Error::WriteFailed);
    h.drain_transitions();

    TEST_CHECK(h.machine->state() == State::Reconnecting);
    TEST_CHECK(h.machine->status().last_error_code == Error::WriteFailed);
    TEST_CHECK(h.transport.last_close_code() == CLOSE_WRITE_FAILED);
    TEST_CHECK(h.machine->reconnect_attempts() == 1);

    // Ignored outside Connected
    h.machine->fail_connection(Error::WriteFailed);
    TEST_CHECK(h.machine->reconnect_attempts() == 1);

    std::cout << "[TEST] OK\n";
}

void test_jittered_delay() {
    std::cout << "[TEST] Group B9: jittered retry delay\n";

    for (int i = 0; i < 20; ++i) {
        Config cfg = test::harness::default_config();
        cfg.backoff.jitter_ratio = 0.2;
        test::MachineHarness h(cfg);
        h.connect_and_open();
        h.transport.emit_close(CLOSE_ABNORMAL);
        h.poll();

        const auto d = retry_delay(h);
        TEST_CHECK(d >= 4000ms);
        TEST_CHECK(d <= 6000ms);
    }

    std::cout << "[TEST] OK\n";
}


int main() {
    test_unclean_close_reconnects();
    test_backoff_schedule_and_exhaustion();
    test_connect_timeout();
    test_connect_skips_retry_delay();
    test_reconnect_not_permitted();
    test_permission_revoked_while_reconnecting();
    test_transport_errors();
    test_write_failure();
    test_jittered_delay();

    std::cout << "\n[GROUP B MACHINE TESTS PASSED]\n";
    return 0;
}
