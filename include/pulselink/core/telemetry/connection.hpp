#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace pulselink::core::telemetry {

// ============================================================================
// Connection Telemetry
//
// Observes connection-level transitions and decisions of one Manager.
// Mechanical facts only. Updated through PL_TL1 / PL_TL2.
// ============================================================================

struct alignas(64) Connection final {
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    // connect() accepted (explicit, demand-driven or environment-driven)
    lcr::metrics::atomic::counter32 connect_calls_total;

    // Reached State::Connected
    lcr::metrics::atomic::counter32 connect_success_total;

    // Attempt failed before Connected (open error, timeout, credentials)
    lcr::metrics::atomic::counter32 connect_failure_total;

    // disconnect() invoked by user
    lcr::metrics::atomic::counter32 disconnect_calls_total;

    // Transport closed while connected (any cause)
    lcr::metrics::atomic::counter32 disconnect_events_total;

    // Events dropped because their generation was stale
    lcr::metrics::atomic::counter32 stale_events_total;

    // ---------------------------------------------------------------------
    // Liveness
    // ---------------------------------------------------------------------

    // Heartbeat probes written
    lcr::metrics::atomic::counter32 heartbeats_sent_total;

    // Forced close due to consecutive silent intervals
    lcr::metrics::atomic::counter32 liveness_timeouts_total;

    // ---------------------------------------------------------------------
    // Retry
    // ---------------------------------------------------------------------

    // Entered State::Reconnecting
    lcr::metrics::atomic::counter32 retry_cycles_started_total;

    // Reconnect delay elapsed and a new attempt was started
    lcr::metrics::atomic::counter32 retry_attempts_total;

    // Reconnect denied by policy (background, offline, no demand)
    lcr::metrics::atomic::counter32 retry_suspended_total;

    // Gave up after max_attempts
    lcr::metrics::atomic::counter32 retry_exhausted_total;

    // ---------------------------------------------------------------------
    // Messages
    // ---------------------------------------------------------------------

    // Frames decoded and dispatched to listeners
    lcr::metrics::atomic::counter64 messages_dispatched_total;

    // Inbound frames dropped by the codec
    lcr::metrics::atomic::counter64 decode_failures_total;

    // Listener invocations that threw
    lcr::metrics::atomic::counter64 listener_failures_total;

    // send() called by user
    lcr::metrics::atomic::counter64 send_calls_total;

    // send() deferred to the outbound queue
    lcr::metrics::atomic::counter64 send_queued_total;

    // Messages lost to queue overflow
    lcr::metrics::atomic::counter64 send_dropped_total;

    // send() refused because the payload is not JSON
    lcr::metrics::atomic::counter64 send_rejected_total;

    // Subscribe / unsubscribe control frames written (including replays)
    lcr::metrics::atomic::counter64 control_frames_total;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Connection Telemetry ===\n";

        os << "Lifecycle\n";
        os << "  Connect calls         : " << lcr::format_number_exact(connect_calls_total.load()) << '\n';
        os << "  Connect success       : " << lcr::format_number_exact(connect_success_total.load()) << '\n';
        os << "  Connect failure       : " << lcr::format_number_exact(connect_failure_total.load()) << '\n';
        os << "  Disconnect calls      : " << lcr::format_number_exact(disconnect_calls_total.load()) << '\n';
        os << "  Disconnect events     : " << lcr::format_number_exact(disconnect_events_total.load()) << '\n';
        os << "  Stale events          : " << lcr::format_number_exact(stale_events_total.load()) << '\n';

        os << "\nLiveness\n";
        os << "  Heartbeats sent       : " << lcr::format_number_exact(heartbeats_sent_total.load()) << '\n';
        os << "  Liveness timeouts     : " << lcr::format_number_exact(liveness_timeouts_total.load()) << '\n';

        os << "\nRetry\n";
        os << "  Retry cycles started  : " << lcr::format_number_exact(retry_cycles_started_total.load()) << '\n';
        os << "  Retry attempts        : " << lcr::format_number_exact(retry_attempts_total.load()) << '\n';
        os << "  Retry suspended       : " << lcr::format_number_exact(retry_suspended_total.load()) << '\n';
        os << "  Retry exhausted       : " << lcr::format_number_exact(retry_exhausted_total.load()) << '\n';

        os << "\nMessages\n";
        os << "  Dispatched            : " << lcr::format_number_exact(messages_dispatched_total.load()) << '\n';
        os << "  Decode failures       : " << lcr::format_number_exact(decode_failures_total.load()) << '\n';
        os << "  Listener failures     : " << lcr::format_number_exact(listener_failures_total.load()) << '\n';
        os << "  Send calls            : " << lcr::format_number_exact(send_calls_total.load()) << '\n';
        os << "  Send queued           : " << lcr::format_number_exact(send_queued_total.load()) << '\n';
        os << "  Send dropped          : " << lcr::format_number_exact(send_dropped_total.load()) << '\n';
        os << "  Send rejected         : " << lcr::format_number_exact(send_rejected_total.load()) << '\n';
        os << "  Control frames        : " << lcr::format_number_exact(control_frames_total.load()) << '\n';
    }
};

static_assert(std::is_standard_layout_v<Connection>, "telemetry::Connection must be standard layout");
static_assert(!std::is_polymorphic_v<Connection>, "telemetry::Connection must not be polymorphic");
static_assert(alignof(Connection) == 64, "telemetry::Connection must be cache-line aligned");

} // namespace pulselink::core::telemetry
