/*
===============================================================================
 Machine Test Harness
===============================================================================

Purpose:
--------
Provides a minimal, deterministic harness for testing
pulselink::core::connection::Machine behavior.

Design:
-------
- Collaborators (clock, transport, credentials, codec, telemetry) outlive
  the Machine
- Machine lifetime is explicit and controllable
- Transitions and inbound messages are collected deterministically
- Time only moves through advance()

===============================================================================
*/
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "pulselink/core/config.hpp"
#include "pulselink/core/codec/json_codec.hpp"
#include "pulselink/core/connection/machine.hpp"
#include "pulselink/core/connection/transition.hpp"
#include "pulselink/core/telemetry/connection.hpp"
#include "common/manual_clock.hpp"
#include "common/mock_credentials.hpp"
#include "common/mock_transport.hpp"
#include "common/test_check.hpp"

// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace pulselink::core;
using namespace pulselink::core::connection;
using namespace std::chrono_literals;

using MachineUnderTest =
    Machine<
        test::MockTransport,
        test::MockCredentials,
        codec::JsonCodec,
        test::ManualClock
    >;


namespace pulselink::core::test {
namespace harness {

inline Config default_config() {
    Config cfg;
    cfg.url = "wss://rt.example.com/socket";
    return cfg;
}

struct Machine {
    // -------------------------------------------------------------------------
    // Persistent collaborators (must outlive the Machine)
    // -------------------------------------------------------------------------
    Config config;
    ManualClock clock;
    MockTransport transport;
    MockCredentials credentials;
    codec::JsonCodec codec;
    telemetry::Connection telemetry;

    // -------------------------------------------------------------------------
    // Machine under test (explicit lifetime)
    // -------------------------------------------------------------------------
    std::unique_ptr<MachineUnderTest> machine;

    // Ordered transition log and inbound messages
    std::vector<Transition> transitions;
    std::vector<std::string> messages;

    explicit Machine(Config cfg = default_config())
        : config(std::move(cfg))
    {
        make_machine();
    }

    inline void make_machine() {
        machine = std::make_unique<MachineUnderTest>(config, transport, credentials, codec, clock, telemetry);
    }

    inline void destroy_machine() {
        machine.reset(); // ~Machine() runs here
    }

    // -------------------------------------------------------------------------
    // Drive
    // -------------------------------------------------------------------------
    inline void poll() {
        machine->poll([this](std::string_view msg) {
            messages.emplace_back(msg);
        });
        drain_transitions();
    }

    inline void advance(std::chrono::milliseconds d) {
        clock.advance(d);
        poll();
    }

    // connect() + handshake completion
    inline void connect_and_open() {
        TEST_CHECK(machine->connect() == Error::None);
        transport.emit_open();
        poll();
        TEST_CHECK(machine->state() == State::Connected);
    }

    inline void drain_transitions() {
        Transition t;
        while (machine->poll_transition(t)) {
            transitions.push_back(t);
        }
    }

    [[nodiscard]]
    inline std::size_t count_transitions_to(State s) const {
        std::size_t n = 0;
        for (const auto& t : transitions) {
            n += (t.to == s) ? 1 : 0;
        }
        return n;
    }

    // Number of probe frames written so far
    [[nodiscard]]
    inline std::size_t probes_sent() {
        std::size_t n = 0;
        for (const auto& text : transport.sent()) {
            codec::Frame f;
            if (codec.decode(text, f) == codec::Result::Ok && f.type == HEARTBEAT_PROBE_TYPE) {
                ++n;
            }
        }
        return n;
    }

    inline void reset_log() {
        transitions.clear();
        messages.clear();
    }
};

} // namespace harness

using MachineHarness = harness::Machine;

} // namespace pulselink::core::test
