/*
===============================================================================
 Manager Test Harness
===============================================================================

Purpose:
--------
Owns every collaborator of a pulselink::Manager with explicit lifetimes and
records every published status.

Design:
-------
- Clock, transport, credentials and environment outlive the Manager
- The status log is fed by an observer registered at construction, so it
  starts with the replayed initial status
- No threads, no sleeps: time only moves through advance()

===============================================================================
*/
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "pulselink/manager.hpp"
#include "pulselink/core/codec/json_codec.hpp"
#include "common/manual_clock.hpp"
#include "common/mock_credentials.hpp"
#include "common/mock_transport.hpp"
#include "common/test_check.hpp"

// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace pulselink::core;
using namespace std::chrono_literals;

using ManagerUnderTest =
    pulselink::Manager<
        test::MockTransport,
        test::MockCredentials,
        test::ManualClock
    >;

using connection::State;
using connection::Status;


namespace pulselink::core::test {
namespace harness {

inline Config default_manager_config() {
    Config cfg;
    cfg.url = "wss://rt.example.com/socket";
    return cfg;
}

struct Manager {
    // -------------------------------------------------------------------------
    // Persistent collaborators (must outlive the Manager)
    // -------------------------------------------------------------------------
    ManualClock clock;
    MockTransport transport;
    MockCredentials credentials;
    environment::Signals signals;

    // -------------------------------------------------------------------------
    // Manager under test (explicit lifetime)
    // -------------------------------------------------------------------------
    std::unique_ptr<ManagerUnderTest> manager;

    // Every status published to the harness observer (replay included)
    std::vector<Status> statuses;

    explicit Manager(Config cfg = default_manager_config()) {
        make_manager(std::move(cfg));
    }

    inline void make_manager(Config cfg) {
        manager = std::make_unique<ManagerUnderTest>(std::move(cfg), transport, credentials, signals, clock);
        manager->observe([this](const Status& s) {
            statuses.push_back(s);
        });
    }

    inline void poll() {
        manager->poll();
    }

    inline void advance(std::chrono::milliseconds d) {
        clock.advance(d);
        manager->poll();
    }

    // Completes the pending handshake of the current attempt
    inline void open() {
        transport.emit_open();
        manager->poll();
    }

    [[nodiscard]]
    inline const Status& last_status() const {
        return statuses.back();
    }

    // Decoded application frames written to the transport (heartbeat probes
    // and subscription control frames excluded)
    [[nodiscard]]
    inline std::vector<codec::Frame> sent_frames() {
        std::vector<codec::Frame> out;
        for (auto& f : written_frames_()) {
            if (f.type != HEARTBEAT_PROBE_TYPE && !is_control_(f)) {
                out.push_back(std::move(f));
            }
        }
        return out;
    }

    // Subscription control frames as "<type>:<topic>", in write order
    [[nodiscard]]
    inline std::vector<std::string> control_frames() {
        std::vector<std::string> out;
        for (const auto& f : written_frames_()) {
            if (is_control_(f)) {
                // payload is {"topic":"<topic>"}
                const auto start = f.payload.find(':') + 2;
                out.push_back(f.type + ":" + f.payload.substr(start, f.payload.size() - start - 2));
            }
        }
        return out;
    }

    // Payloads of the frames written to the transport, in write order
    [[nodiscard]]
    inline std::vector<std::string> sent_payloads() {
        std::vector<std::string> out;
        for (const auto& f : sent_frames()) {
            out.push_back(f.payload);
        }
        return out;
    }

    codec::JsonCodec codec;

private:
    [[nodiscard]]
    inline std::vector<codec::Frame> written_frames_() {
        std::vector<codec::Frame> out;
        for (const auto& text : transport.sent()) {
            codec::Frame f;
            TEST_CHECK(codec.decode(text, f) == codec::Result::Ok);
            out.push_back(std::move(f));
        }
        return out;
    }

    [[nodiscard]]
    inline bool is_control_(const codec::Frame& f) const {
        const auto& sc = manager->config().subscriptions;
        return f.type == sc.subscribe_type || f.type == sc.unsubscribe_type;
    }
};

} // namespace harness

using ManagerHarness = harness::Manager;

} // namespace pulselink::core::test
