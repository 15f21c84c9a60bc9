/*
===============================================================================
 pulselink::Manager - Group B Unit Tests
===============================================================================

Scope:
------
Send path: immediate writes, the outbound queue and its FIFO drain.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

1. Connected with an empty queue -> written immediately with a unique id
2. Messages sent while not Connected are queued and drained in FIFO order
   on Connected, before observers see the new status and before any later
   send
3. 105 sends into a 100-slot queue keep messages 6..105; overflow listeners
   see every lost message
4. A failed immediate write re-queues the message
5. A failed drain write keeps the remaining messages and reconnects
6. DropNewest / Reject report QueueOverflow
7. Outbound message ids are unique, <prefix>-<sequence>
8. A payload that is not exactly one JSON value is refused with
   ProtocolError and never reaches the wire or the queue

===============================================================================
*/

#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "common/harness/manager.hpp"


static std::vector<std::string> numbers(int from, int to) {
    std::vector<std::string> out;
    for (int i = from; i <= to; ++i) {
        out.push_back(std::to_string(i));
    }
    return out;
}


void test_immediate_write() {
    std::cout << "[TEST] Group B1: immediate write while Connected\n";

    test::ManagerHarness h;
    auto sub = h.manager->subscribe("orders", [](const codec::Frame&) {});
    h.open();

    TEST_CHECK(h.manager->send("order", R"({"qty":1})") == Error::None);
    TEST_CHECK(h.manager->send("order", R"({"qty":2})") == Error::None);
    TEST_CHECK(h.manager->queue_depth() == 0);
    TEST_CHECK(h.manager->tx_messages() == 2);

    const auto frames = h.sent_frames();
    TEST_CHECK(frames.size() == 2);
    TEST_CHECK(frames[0].type == "order");
    TEST_CHECK(frames[0].payload == R"({"qty":1})");
    TEST_CHECK(!frames[0].id.empty());
    TEST_CHECK(frames[0].id != frames[1].id);

    std::cout << "[TEST] OK\n";
}

void test_fifo_drain_on_connect() {
    std::cout << "[TEST] Group B2: queued messages drained first, in order\n";

    test::ManagerHarness h;

    // No demand yet: nothing connects
    TEST_CHECK(h.manager->send("order", "1") == Error::None);
    TEST_CHECK(h.manager->send("order", "2") == Error::None);
    TEST_CHECK(h.manager->send("order", "3") == Error::None);
    TEST_CHECK(h.manager->queue_depth() == 3);
    TEST_CHECK(h.transport.open_calls() == 0);

    std::size_t depth_when_connected = 99;
    (void)h.manager->observe([&](const Status& s) {
        if (s.is_connected()) {
            depth_when_connected = h.manager->queue_depth();
        }
    });

    auto sub = h.manager->subscribe("orders", [](const codec::Frame&) {});
    TEST_CHECK(h.manager->send("order", "4") == Error::None);   // while Connecting
    TEST_CHECK(h.manager->queue_depth() == 4);
    TEST_CHECK(h.transport.sent().empty());

    h.open();
    TEST_CHECK(depth_when_connected == 0);
    TEST_CHECK(h.manager->queue_depth() == 0);

    TEST_CHECK(h.manager->send("order", "5") == Error::None);
    TEST_CHECK(h.sent_payloads() == numbers(1, 5));

    std::cout << "[TEST] OK\n";
}

void test_queue_overflow_drop_oldest() {
    std::cout << "[TEST] Group B3: overflow evicts the oldest messages\n";

    test::ManagerHarness h;
    std::vector<std::string> lost;
    h.manager->on_queue_overflow([&](const ManagerUnderTest::OutboundMessage& m, std::size_t depth) {
        lost.push_back(m.payload);
        TEST_CHECK(depth == 100);
    });

    for (int i = 1; i <= 105; ++i) {
        TEST_CHECK(h.manager->send("order", std::to_string(i)) == Error::None);
    }
    TEST_CHECK(h.manager->queue_depth() == 100);
    TEST_CHECK(h.manager->dropped_messages() == 5);
    TEST_CHECK(lost == numbers(1, 5));

    auto sub = h.manager->subscribe("orders", [](const codec::Frame&) {});
    h.open();
    TEST_CHECK(h.sent_payloads() == numbers(6, 105));

    std::cout << "[TEST] OK\n";
}

void test_immediate_write_failure_requeues() {
    std::cout << "[TEST] Group B4: failed immediate write is re-queued\n";

    test::ManagerHarness h;
    auto sub = h.manager->subscribe("orders", [](const codec::Frame&) {});
    h.open();

    h.transport.fail_next_writes(1);
    TEST_CHECK(h.manager->send("order", "1") == Error::None);
    TEST_CHECK(h.manager->queue_depth() == 1);
    TEST_CHECK(h.manager->status().is_connected());

    // Later sends stay behind it
    TEST_CHECK(h.manager->send("order", "2") == Error::None);
    TEST_CHECK(h.manager->queue_depth() == 2);

    h.poll();
    TEST_CHECK(h.manager->queue_depth() == 0);
    TEST_CHECK(h.sent_payloads() == numbers(1, 2));

    std::cout << "[TEST] OK\n";
}

void test_drain_failure_reconnects() {
    std::cout << "[TEST] Group B5: failed drain write keeps the queue\n";

    test::ManagerHarness h;
    for (int i = 1; i <= 3; ++i) {
        TEST_CHECK(h.manager->send("order", std::to_string(i)) == Error::None);
    }
    auto sub = h.manager->subscribe("orders", [](const codec::Frame&) {});

    h.transport.fail_next_writes(1);
    h.open();

    TEST_CHECK(h.manager->status().is_reconnecting());
    TEST_CHECK(h.manager->status().last_error_code == Error::WriteFailed);
    TEST_CHECK(h.manager->queue_depth() == 3);
    TEST_CHECK(h.transport.last_close_code() == CLOSE_WRITE_FAILED);
    TEST_CHECK(h.transport.sent().empty());

    h.advance(5s);
    TEST_CHECK(h.manager->status().is_connecting());
    h.open();
    TEST_CHECK(h.manager->status().is_connected());
    TEST_CHECK(h.manager->queue_depth() == 0);
    TEST_CHECK(h.sent_payloads() == numbers(1, 3));

    std::cout << "[TEST] OK\n";
}

void test_drop_newest_and_reject() {
    std::cout << "[TEST] Group B6: DropNewest and Reject policies\n";

    for (const auto policy : {OverflowPolicy::DropNewest, OverflowPolicy::Reject}) {
        Config cfg = test::harness::default_manager_config();
        cfg.queue.capacity = 2;
        cfg.queue.overflow = policy;
        test::ManagerHarness h(cfg);

        int lost = 0;
        h.manager->on_queue_overflow([&](const ManagerUnderTest::OutboundMessage& m, std::size_t) {
            TEST_CHECK(m.payload == "3");
            ++lost;
        });

        TEST_CHECK(h.manager->send("order", "1") == Error::None);
        TEST_CHECK(h.manager->send("order", "2") == Error::None);
        TEST_CHECK(h.manager->send("order", "3") == Error::QueueOverflow);
        TEST_CHECK(lost == 1);
        TEST_CHECK(h.manager->queue_depth() == 2);
        TEST_CHECK(h.manager->dropped_messages() == 1);

        auto sub = h.manager->subscribe("orders", [](const codec::Frame&) {});
        h.open();
        TEST_CHECK(h.sent_payloads() == numbers(1, 2));
    }

    std::cout << "[TEST] OK\n";
}

void test_message_ids_unique() {
    std::cout << "[TEST] Group B7: message ids are unique\n";

    test::ManagerHarness h;
    for (int i = 0; i < 50; ++i) {
        TEST_CHECK(h.manager->send("order", "{}") == Error::None);
    }
    auto sub = h.manager->subscribe("orders", [](const codec::Frame&) {});
    h.open();

    const auto frames = h.sent_frames();
    std::set<std::string> ids;
    for (const auto& f : frames) {
        ids.insert(f.id);
    }
    TEST_CHECK(ids.size() == 50);

    // <8 hex digit prefix>-<sequence>, sequence starting at 1
    const std::string& first = frames.front().id;
    TEST_CHECK(first.size() == 10);
    TEST_CHECK(first.find_first_not_of("0123456789abcdef") == 8);
    TEST_CHECK(first.substr(8) == "-1");
    TEST_CHECK(frames.back().id.substr(8) == "-50");

    std::cout << "[TEST] OK\n";
}

void test_non_json_payload_refused() {
    std::cout << "[TEST] Group B8: non-JSON payload is refused\n";

    test::ManagerHarness h;

    // Not connected: nothing is queued
    TEST_CHECK(h.manager->send("chat", "not json") == Error::ProtocolError);
    TEST_CHECK(h.manager->queue_depth() == 0);

    auto sub = h.manager->subscribe("orders", [](const codec::Frame&) {});
    h.open();
    const std::size_t written = h.transport.sent().size();

    // Connected: nothing is written, no field can be smuggled into the frame
    TEST_CHECK(h.manager->send("chat", R"(1,"type":"admin")") == Error::ProtocolError);
    TEST_CHECK(h.manager->send("chat", R"({"text":"hi")") == Error::ProtocolError);
    TEST_CHECK(h.transport.sent().size() == written);
    TEST_CHECK(h.manager->queue_depth() == 0);
    TEST_CHECK(h.manager->tx_messages() == 0);

    // Valid payloads still go out, and every written frame decodes
    TEST_CHECK(h.manager->send("chat", R"({"text":"hi"})") == Error::None);
    TEST_CHECK(h.manager->send("chat") == Error::None);
    const auto frames = h.sent_frames();
    TEST_CHECK(frames.size() == 2);
    TEST_CHECK(frames[0].type == "chat");
    TEST_CHECK(frames[0].payload == R"({"text":"hi"})");
    TEST_CHECK(frames[1].payload.empty());

    std::cout << "[TEST] OK\n";
}


int main() {
    test_immediate_write();
    test_fifo_drain_on_connect();
    test_queue_overflow_drop_oldest();
    test_immediate_write_failure_requeues();
    test_drain_failure_reconnects();
    test_drop_newest_and_reject();
    test_message_ids_unique();
    test_non_json_payload_refused();

    std::cout << "\n[GROUP B MANAGER TESTS PASSED]\n";
    return 0;
}
