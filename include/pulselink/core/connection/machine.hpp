#pragma once

#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <utility>

#include "pulselink/core/backoff.hpp"
#include "pulselink/core/clock.hpp"
#include "pulselink/core/config.hpp"
#include "pulselink/core/error.hpp"
#include "pulselink/core/telemetry.hpp"
#include "pulselink/core/telemetry/connection.hpp"
#include "pulselink/core/timer/table.hpp"
#include "pulselink/core/codec/concepts.hpp"
#include "pulselink/core/credential/concepts.hpp"
#include "pulselink/core/transport/concepts.hpp"
#include "pulselink/core/transport/url.hpp"
#include "pulselink/core/connection/state.hpp"
#include "pulselink/core/connection/status.hpp"
#include "pulselink/core/connection/transition.hpp"
#include "lcr/format.hpp"
#include "lcr/json.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/log/logger.hpp"


namespace pulselink::core::connection {

/*
===============================================================================
 pulselink::core::connection::Machine
===============================================================================

State machine owning one logical connection:

    Disconnected -> Connecting -> Connected -> Reconnecting -> Connecting ...

Parameterized by a transport, a credential provider, a frame codec (used for
heartbeat probes) and a clock, all conforming to their concepts.

-------------------------------------------------------------------------------
 Generations
-------------------------------------------------------------------------------
Every connection attempt runs under its own generation number. The generation
is passed to transport.open() and attached to every armed timer. It is bumped
whenever an attempt ends (failure, abandonment, disconnect), so that:

  - transport events of an abandoned attempt are dropped (a late Open is
    never promoted to Connected)
  - timers armed by an abandoned attempt never fire

-------------------------------------------------------------------------------
 Timers (one slot per kind, see timer::Table)
-------------------------------------------------------------------------------
  ConnectTimeout   armed on entering Connecting
  Heartbeat        armed while Connected, re-armed on every tick
  ReconnectDelay   armed on entering Reconnecting

All timers are cancelled on every state exit.

-------------------------------------------------------------------------------
 Liveness
-------------------------------------------------------------------------------
While Connected, a probe frame is written every heartbeat interval. A tick
that observed no inbound traffic since the previous tick counts as missed;
heartbeat.max_missed consecutive missed ticks force-close the transport and
take the unclean-close path.

-------------------------------------------------------------------------------
 Reconnect policy
-------------------------------------------------------------------------------
The owner sets whether reconnecting is currently permitted
(set_reconnect_permitted). The permission is checked when a retry is
scheduled and again when its delay expires. Revoking it while Reconnecting
resolves to Disconnected.

-------------------------------------------------------------------------------
 Observability
-------------------------------------------------------------------------------
Each state change is recorded as a connection::Transition (with the status
snapshot after the change) in a local ring that the owner drains through
poll_transition().

No background threads; all progress happens inside connect(), disconnect(),
poll() and the owner-triggered failure hooks.
===============================================================================
*/

template <
    transport::TransportConcept Transport,
    credential::ProviderConcept Credentials,
    codec::CodecConcept Codec,
    ClockConcept Clock
>
class Machine {
public:
    Machine(const Config& config,
            Transport& transport,
            Credentials& credentials,
            Codec& codec,
            Clock& clock,
            telemetry::Connection& telemetry)
        : config_(config)
        , transport_(transport)
        , credentials_(credentials)
        , codec_(codec)
        , clock_(clock)
        , telemetry_(telemetry)
        , rng_(std::random_device{}())
        , last_inbound_(clock.now())
    {
    }

    // Transport is closed on destruction; no reconnect outlives the machine.
    ~Machine() {
        if (state_ != State::Disconnected) {
            timers_.cancel_all();
            transport_.close(CLOSE_NORMAL, "shutdown");
        }
    }

    Machine(const Machine&) = delete;
    Machine& operator=(const Machine&) = delete;

    // -------------------------------------------------------------------------
    // User intent
    // -------------------------------------------------------------------------

    // Starts a connection attempt. Accepted from Disconnected (attempt counter
    // reset) and from Reconnecting (pending delay skipped).
    [[nodiscard]]
    inline Error connect() {
        if (state_ == State::Connected || state_ == State::Connecting) {
            PL_DEBUG("[CONN] connect() ignored (state: " << to_string(state_) << ")");
            return Error::InvalidState;
        }
        PL_TL1( telemetry_.connect_calls_total.inc() );
        transition_(Event::ConnectRequested);
        resolve_credentials_();
        return Error::None;
    }

    // Always accepted. Cancels every timer and abandons any in-flight attempt.
    inline void disconnect() {
        PL_TL1( telemetry_.disconnect_calls_total.inc() );
        if (state_ == State::Disconnected) {
            return; // idempotent
        }
        transition_(Event::DisconnectRequested);
    }

    // -------------------------------------------------------------------------
    // Owner hooks
    // -------------------------------------------------------------------------

    // Writes one frame on the current connection (Connected only)
    [[nodiscard]]
    inline bool write(std::string_view text) {
        if (state_ != State::Connected) {
            return false;
        }
        if (!transport_.send(text)) {
            PL_WARN("[CONN] Transport write failed (" << text.size() << " bytes)");
            return false;
        }
        ++tx_messages_;
        return true;
    }

    // Writes a control frame (not counted as application traffic)
    [[nodiscard]]
    inline bool write_control(std::string_view text) {
        if (state_ != State::Connected) {
            return false;
        }
        if (!transport_.send(text)) {
            PL_WARN("[CONN] Transport write failed for control frame (" << text.size() << " bytes)");
            return false;
        }
        return true;
    }

    // A queued frame could not be written: handled as an unclean close
    inline void fail_connection(Error error) {
        if (state_ != State::Connected) {
            return;
        }
        transport_.close(CLOSE_WRITE_FAILED, "write failed");
        transition_(Event::WriteFailed, error);
    }

    // Abandons an in-flight attempt (e.g. network lost while Connecting)
    inline void abandon_attempt(Error reason) {
        if (state_ != State::Connecting) {
            return;
        }
        PL_INFO("[CONN] Abandoning connection attempt (generation " << generation_ << "): " << describe(reason));
        transport_.close(CLOSE_ABANDONED, "attempt abandoned");
        transition_(Event::AttemptAbandoned, reason);
    }

    inline void set_reconnect_permitted(bool permitted) {
        if (permitted_ == permitted) {
            return;
        }
        permitted_ = permitted;
        PL_DEBUG("[CONN] Reconnect " << (permitted ? "permitted" : "suspended"));
        if (!permitted && state_ == State::Reconnecting) {
            transition_(Event::ReconnectDenied, Error::ReconnectSuspended);
        }
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------
    //
    // Drains transport events and fires due timers. on_message is invoked
    // for every inbound frame of the current connection, in arrival order.
    //
    template<class OnMessage>
    inline void poll(OnMessage&& on_message) {
        // === Asynchronous credentials ===
        if (state_ == State::Connecting && awaiting_credentials_) {
            resolve_credentials_();
        }
        // === Drain transport events ===
        transport::Event ev;
        while (transport_.poll_event(ev)) {
            if (ev.generation != generation_) {
                PL_TRACE("[CONN] Dropping stale " << transport::to_string(ev.type)
                      << " event (generation " << ev.generation << ", current " << generation_ << ")");
                PL_TL1( telemetry_.stale_events_total.inc() );
                continue;
            }
            switch (ev.type) {
                case transport::EventType::Open:
                    on_transport_open_();
                    break;
                case transport::EventType::Message:
                    if (state_ == State::Connected) {
                        last_inbound_ = clock_.now();
                        inbound_since_tick_ = true;
                        ++rx_messages_;
                        on_message(std::string_view{ev.data});
                    }
                    break;
                case transport::EventType::Close:
                    on_transport_closed_(ev.close_code);
                    break;
                case transport::EventType::Error:
                    on_transport_error_(ev.error);
                    break;
            }
        }
        // === Timers ===
        timer::Kind kind;
        while (timers_.pop_expired(clock_.now(), generation_, kind)) {
            on_timer_(kind);
        }
    }

    [[nodiscard]]
    inline bool poll_transition(Transition& out) {
        return transitions_.pop(out);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline State state() const noexcept {
        return state_;
    }

    [[nodiscard]]
    inline Status status() const {
        Status s;
        s.state = state_;
        s.reconnect_attempts = attempts_;
        s.last_error = std::string(describe(last_error_code_));
        s.last_error_code = last_error_code_;
        if (state_ == State::Connected) {
            s.connection_id = connection_id_;
        }
        return s;
    }

    [[nodiscard]]
    inline std::uint32_t reconnect_attempts() const noexcept {
        return attempts_;
    }

    [[nodiscard]]
    inline bool reconnect_permitted() const noexcept {
        return permitted_;
    }

    // Generation of the current (or last) connection attempt
    [[nodiscard]]
    inline std::uint64_t generation() const noexcept {
        return generation_;
    }

    // Number of connections that reached Connected
    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return epoch_;
    }

    [[nodiscard]]
    inline std::uint64_t rx_messages() const noexcept {
        return rx_messages_;
    }

    [[nodiscard]]
    inline std::uint64_t tx_messages() const noexcept {
        return tx_messages_;
    }

    [[nodiscard]]
    inline time_point last_inbound() const noexcept {
        return last_inbound_;
    }

    [[nodiscard]]
    inline std::uint32_t missed_heartbeats() const noexcept {
        return missed_heartbeats_;
    }

    [[nodiscard]]
    inline const timer::Table& timers() const noexcept {
        return timers_;
    }

private:
    const Config& config_;
    Transport& transport_;
    Credentials& credentials_;
    Codec& codec_;
    Clock& clock_;
    telemetry::Connection& telemetry_;   // Telemetry reference (not owned)

    // State machine
    State state_{State::Disconnected};
    std::uint32_t attempts_{0};          // Reconnect attempts of the current cycle
    Error last_error_code_{Error::None};
    std::string connection_id_;          // Meaningful only while Connected
    bool permitted_{true};               // Reconnect policy, set by the owner
    bool awaiting_credentials_{false};

    // Generation of the current attempt; bumped on every attempt start and end
    std::uint64_t generation_{0};
    // Completed connections (incremented on Connected only)
    std::uint64_t epoch_{0};

    timer::Table timers_;
    std::mt19937_64 rng_;

    // Activity tracking (liveness and observability)
    std::uint64_t rx_messages_{0};
    std::uint64_t tx_messages_{0};
    time_point last_inbound_;
    bool inbound_since_tick_{false};
    std::uint32_t missed_heartbeats_{0};

    // Pending transition records (machine -> owner)
    lcr::local::ring_buffer<Transition, TRANSITION_RING_CAPACITY> transitions_;

private:
    // State mutator: logs and records the transition
    inline void enter_(State next, Event event) {
        const State prev = state_;
        state_ = next;
        if (next != State::Connected) {
            connection_id_.clear();
        }
        PL_TRACE("[FSM] " << to_string(prev) << " --" << to_string(event) << "--> " << to_string(next));
        Transition t;
        t.from = prev;
        t.to = next;
        t.event = event;
        t.generation = generation_;
        t.status = status();
        if (transitions_.push_overwrite(std::move(t))) {
            PL_WARN("[FSM] Transition ring full: oldest unpublished transition dropped");
        }
    }

    // State machine transition function
    inline void transition_(Event event, Error error = Error::None) {
        const State state = state_;

        switch (state) {

        // ================================================================
        case State::Disconnected:
            switch (event) {
            case Event::ConnectRequested:
                attempts_ = 0;
                begin_attempt_(event);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportOpened: {
                timers_.cancel_all();
                const auto now = clock_.now();
                attempts_ = 0;
                last_error_code_ = Error::None;
                ++epoch_;
                connection_id_.clear();
                lcr::json::append_hex(connection_id_, rng_(), 16);
                connection_id_ += '-';
                lcr::json::append(connection_id_, epoch_);
                last_inbound_ = now;
                inbound_since_tick_ = false;
                missed_heartbeats_ = 0;
                timers_.arm(timer::Kind::Heartbeat, now + config_.heartbeat.interval, generation_);
                PL_TL1( telemetry_.connect_success_total.inc() );
                enter_(State::Connected, event);
                PL_INFO("[CONN] Connected to server: " << config_.url << " (connection " << connection_id_ << ")");
                break;
            }

            case Event::CredentialUnavailable:
                // Caller must re-authenticate; never retried automatically
                timers_.cancel_all();
                ++generation_;
                awaiting_credentials_ = false;
                last_error_code_ = error;
                PL_TL1( telemetry_.connect_failure_total.inc() );
                enter_(State::Disconnected, event);
                PL_ERROR("[CONN] Connection aborted: " << describe(error));
                break;

            case Event::TransportOpenFailed:
            case Event::ConnectTimeout:
            case Event::AttemptAbandoned:
                PL_TL1( telemetry_.connect_failure_total.inc() );
                fail_(event, error);
                break;

            case Event::DisconnectRequested:
                shutdown_(event);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::TransportClosedClean:
                PL_TL1( telemetry_.disconnect_events_total.inc() );
                timers_.cancel_all();
                ++generation_;
                attempts_ = 0;
                last_error_code_ = Error::None;
                enter_(State::Disconnected, event);
                PL_INFO("[CONN] Connection closed by server: " << config_.url << " (normal closure)");
                break;

            case Event::TransportClosedUnclean:
            case Event::LivenessExpired:
            case Event::WriteFailed:
                PL_TL1( telemetry_.disconnect_events_total.inc() );
                PL_INFO("[CONN] Connection lost: " << config_.url << " (" << describe(error) << ")");
                fail_(event, error);
                break;

            case Event::DisconnectRequested:
                shutdown_(event);
                PL_INFO("[CONN] Disconnected from server: " << config_.url);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Reconnecting:
            switch (event) {
            case Event::RetryTimerExpired:
                if (!permitted_) {
                    suspend_(event);
                    break;
                }
                PL_TL1( telemetry_.retry_attempts_total.inc() );
                begin_attempt_(event);
                break;

            case Event::ConnectRequested:
                // Explicit connect() overrides the pending delay
                begin_attempt_(event);
                break;

            case Event::ReconnectDenied:
                suspend_(event);
                break;

            case Event::DisconnectRequested:
                shutdown_(event);
                break;

            default:
                break;
            }
            break;
        }
    }

    // Enters Connecting under a fresh generation and arms the connect timeout
    inline void begin_attempt_(Event event) {
        timers_.cancel_all();
        ++generation_;
        awaiting_credentials_ = false;
        timers_.arm(timer::Kind::ConnectTimeout, clock_.now() + config_.connect_timeout, generation_);
        enter_(State::Connecting, event);
        PL_DEBUG("[CONN] Connecting to: " << config_.url
              << " (generation " << generation_ << ", attempt " << attempts_ << ")");
    }

    // Failure of the current attempt or connection: schedule a retry if allowed
    inline void fail_(Event event, Error error) {
        timers_.cancel_all();
        ++generation_;  // late events of the failed attempt become stale
        awaiting_credentials_ = false;
        last_error_code_ = error;

        if (!permitted_) {
            PL_INFO("[CONN] Reconnect not permitted after '" << describe(error) << "'. Staying disconnected.");
            PL_TL1( telemetry_.retry_suspended_total.inc() );
            enter_(State::Disconnected, event);
            return;
        }
        if (attempts_ >= config_.backoff.max_attempts) {
            last_error_code_ = Error::MaxAttemptsExceeded;
            PL_TL1( telemetry_.retry_exhausted_total.inc() );
            enter_(State::Disconnected, event);
            PL_ERROR("[CONN] Giving up after " << attempts_ << " reconnect attempts (last failure: " << describe(error) << ")");
            return;
        }
        ++attempts_;
        const auto delay = backoff::jittered(backoff::delay(attempts_, config_.backoff), config_.backoff, rng_);
        timers_.arm(timer::Kind::ReconnectDelay, clock_.now() + delay, generation_);
        PL_TL1( telemetry_.retry_cycles_started_total.inc() );
        enter_(State::Reconnecting, event);
        PL_INFO("[CONN] Next reconnection attempt (" << attempts_ << "/" << config_.backoff.max_attempts
             << ") in " << lcr::format_duration(delay));
    }

    // Reconnecting -> Disconnected: policy forbids further attempts
    inline void suspend_(Event event) {
        timers_.cancel_all();
        ++generation_;
        last_error_code_ = Error::ReconnectSuspended;
        PL_TL1( telemetry_.retry_suspended_total.inc() );
        enter_(State::Disconnected, event);
        PL_INFO("[CONN] Reconnect suspended (background, offline or no active subscriptions)");
    }

    // Explicit disconnect from any state
    inline void shutdown_(Event event) {
        const bool transport_active = (state_ == State::Connecting || state_ == State::Connected);
        timers_.cancel_all();
        ++generation_;
        awaiting_credentials_ = false;
        attempts_ = 0;
        last_error_code_ = Error::None;
        if (transport_active) {
            transport_.close(CLOSE_NORMAL, "client disconnect");
        }
        enter_(State::Disconnected, event);
    }

    // Looks up the access token and, once available, opens the transport
    inline void resolve_credentials_() {
        if (state_ != State::Connecting) {
            return;
        }
        std::string token;
        const credential::Status cs = credentials_.access_token(token);
        switch (cs) {
            case credential::Status::Pending:
                if (!awaiting_credentials_) {
                    PL_DEBUG("[CONN] Waiting for access token");
                }
                awaiting_credentials_ = true;
                return;

            case credential::Status::Unavailable:
                transition_(Event::CredentialUnavailable, Error::CredentialUnavailable);
                return;

            case credential::Status::Ready:
                break;
        }
        awaiting_credentials_ = false;
        const std::string url = transport::build_connect_url(config_.url, token, config_.platform, config_.tenant_id);
        const Error err = transport_.open(url, generation_);
        if (err != Error::None) {
            PL_ERROR("[CONN] Transport open failed (" << to_string(err) << ")");
            transition_(Event::TransportOpenFailed, Error::TransportOpenFailed);
        }
    }

    inline void on_transport_open_() {
        if (state_ != State::Connecting || awaiting_credentials_) {
            return;
        }
        transition_(Event::TransportOpened);
    }

    inline void on_transport_closed_(std::uint16_t code) {
        if (state_ == State::Connecting) {
            PL_WARN("[CONN] Transport closed before open completed (code " << code << ")");
            transition_(Event::TransportOpenFailed, Error::TransportOpenFailed);
            return;
        }
        if (state_ == State::Connected) {
            if (code == CLOSE_NORMAL) {
                transition_(Event::TransportClosedClean);
            } else {
                PL_WARN("[CONN] Transport closed uncleanly (code " << code << ")");
                transition_(Event::TransportClosedUnclean, Error::TransportClosed);
            }
        }
    }

    inline void on_transport_error_(Error error) {
        PL_WARN("[CONN] Transport error: " << to_string(error));
        if (state_ == State::Connecting) {
            transport_.close(CLOSE_TRANSPORT_ERROR, "transport error");
            transition_(Event::TransportOpenFailed, Error::TransportOpenFailed);
            return;
        }
        if (state_ == State::Connected) {
            transport_.close(CLOSE_TRANSPORT_ERROR, "transport error");
            transition_(Event::TransportClosedUnclean, Error::TransportClosed);
        }
    }

    inline void on_timer_(timer::Kind kind) {
        PL_TRACE("[CONN] Timer expired: " << timer::to_string(kind) << " (generation " << generation_ << ")");
        switch (kind) {
            case timer::Kind::ConnectTimeout:
                if (state_ == State::Connecting) {
                    PL_WARN("[CONN] Connection not established within " << lcr::format_duration(config_.connect_timeout));
                    transport_.close(CLOSE_OPEN_TIMEOUT, "connect timeout");
                    transition_(Event::ConnectTimeout, Error::OpenTimeout);
                }
                break;

            case timer::Kind::Heartbeat:
                if (state_ == State::Connected) {
                    on_heartbeat_tick_();
                }
                break;

            case timer::Kind::ReconnectDelay:
                if (state_ == State::Reconnecting) {
                    transition_(Event::RetryTimerExpired);
                    resolve_credentials_();
                }
                break;
        }
    }

    inline void on_heartbeat_tick_() {
        if (inbound_since_tick_) {
            missed_heartbeats_ = 0;
        } else {
            ++missed_heartbeats_;
        }
        inbound_since_tick_ = false;

        if (missed_heartbeats_ >= config_.heartbeat.max_missed) {
            PL_WARN("[CONN] Liveness timeout: no inbound traffic for " << missed_heartbeats_
                 << " heartbeat intervals (forcing reconnect)");
            PL_TL1( telemetry_.liveness_timeouts_total.inc() );
            transport_.close(CLOSE_LIVENESS_FAILED, "liveness timeout");
            transition_(Event::LivenessExpired, Error::LivenessTimeout);
            return;
        }
        codec::Frame probe;
        probe.type = std::string(HEARTBEAT_PROBE_TYPE);
        if (transport_.send(codec_.encode(probe))) {
            PL_TL1( telemetry_.heartbeats_sent_total.inc() );
        } else {
            PL_WARN("[CONN] Heartbeat probe could not be written");
        }
        timers_.arm(timer::Kind::Heartbeat, clock_.now() + config_.heartbeat.interval, generation_);
    }
};

} // namespace pulselink::core::connection
