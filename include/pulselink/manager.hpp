/*
===============================================================================
pulselink Manager
===============================================================================

Single public entry point of the realtime connection core: connect,
disconnect, send, subscribe and observe.

Architecture:
  - connection::Machine       → lifecycle of the one logical connection
                                 • connect / reconnect with backoff
                                 • heartbeat & liveness
                                 • generation tagging of attempts and timers
  - queue::OutboundQueue      → bounded FIFO for messages sent while offline
  - subscription::Registry    → topic -> listeners, demand for a connection
  - environment::Signals      → foreground / reachability changes
  - Codec (JsonCodec)         → frame <-> wire text

The Manager:
  - Is explicitly constructed and owned by the application (no global)
  - Is driven by poll() from a single owner thread
  - Publishes every status change synchronously to observers, and replays
    the current status to each new observer
  - Announces active topics to the server (subscribe / unsubscribe control
    frames), replaying all of them on every new connection
  - Drains the outbound queue in FIFO order whenever a connection is
    established, right after the topic replay and before anything sent
    afterwards
  - Derives the reconnect policy from the environment and the registry:
        foreground && network reachable && at least one active subscription

Failures of the transport, timers and credentials never throw; they surface
through the published Status (last_error / last_error_code).
===============================================================================
*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pulselink/core/clock.hpp"
#include "pulselink/core/config.hpp"
#include "pulselink/core/error.hpp"
#include "pulselink/core/telemetry.hpp"
#include "pulselink/core/telemetry/connection.hpp"
#include "pulselink/core/codec/concepts.hpp"
#include "pulselink/core/codec/frame.hpp"
#include "pulselink/core/codec/json_codec.hpp"
#include "pulselink/core/credential/concepts.hpp"
#include "pulselink/core/transport/concepts.hpp"
#include "pulselink/core/connection/machine.hpp"
#include "pulselink/core/connection/status.hpp"
#include "pulselink/core/connection/transition.hpp"
#include "pulselink/core/environment/signals.hpp"
#include "pulselink/core/queue/outbound_queue.hpp"
#include "pulselink/core/subscription/registry.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/sequence.hpp"


namespace pulselink {

template<
    core::transport::TransportConcept Transport,
    core::credential::ProviderConcept Credentials,
    core::ClockConcept Clock = core::SteadyClock,
    core::codec::CodecConcept Codec = core::codec::JsonCodec
>
class Manager {
public:
    using Status           = core::connection::Status;
    using Frame            = core::codec::Frame;
    using OutboundMessage  = core::queue::OutboundMessage;
    using Subscription     = core::subscription::Subscription;
    using Listener         = core::subscription::Listener;
    using ListenerPtr      = core::subscription::ListenerPtr;
    using StatusListener   = std::function<void(const Status&)>;
    using OverflowListener = std::function<void(const OutboundMessage& lost, std::size_t depth)>;
    using Machine          = core::connection::Machine<Transport, Credentials, Codec, Clock>;

    Manager(core::Config config,
            Transport& transport,
            Credentials& credentials,
            core::environment::Signals& signals,
            Clock& clock)
        : config_(std::move(config))
        , config_error_(core::validate(config_))
        , signals_(signals)
        , clock_(clock)
        , machine_(config_, transport, credentials, codec_, clock, telemetry_)
        , queue_(config_.queue.capacity, config_.queue.overflow)
        , id_prefix_(make_id_prefix_())
    {
        if (config_error_ != core::Error::None) {
            PL_ERROR("[MANAGER] Invalid configuration (" << core::to_string(config_error_) << "): connect() will be refused");
        }
        update_policy_();
    }

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Starts connecting (no-op with InvalidState while Connecting/Connected).
    // Completion is observed through the published status.
    [[nodiscard]]
    inline core::Error connect() {
        if (config_error_ != core::Error::None) {
            return config_error_;
        }
        user_disconnected_ = false;
        update_policy_();
        const core::Error err = machine_.connect();
        publish_transitions_();
        return err;
    }

    // Always accepted; terminal until connect() is called again.
    inline void disconnect() {
        user_disconnected_ = true;
        machine_.disconnect();
        publish_transitions_();
    }

    // -------------------------------------------------------------------------
    // Send path
    // -------------------------------------------------------------------------
    //
    // payload is JSON text embedded verbatim in the frame: exactly one JSON
    // value, or empty for no payload. Anything else is refused with
    // ProtocolError and neither written nor queued.
    //
    // Writes immediately when Connected and nothing is queued ahead,
    // otherwise appends to the outbound queue. Returns QueueOverflow when the
    // message itself was not admitted (DropNewest / Reject policies).
    //
    [[nodiscard]]
    inline core::Error send(std::string_view type, std::string_view payload = {}) {
        PL_TL1( telemetry_.send_calls_total.inc() );
        if (codec_.check_payload(payload) != core::codec::Result::Ok) {
            PL_ERROR("[MANAGER] send('" << type << "') refused: payload is not a single JSON value");
            PL_TL1( telemetry_.send_rejected_total.inc() );
            return core::Error::ProtocolError;
        }
        OutboundMessage msg;
        msg.id = next_message_id_();
        msg.type.assign(type);
        msg.payload.assign(payload);
        msg.enqueued_at = clock_.now();

        if (machine_.state() == core::connection::State::Connected && queue_.empty()) {
            if (machine_.write(codec_.encode(to_frame_(msg)))) {
                return core::Error::None;
            }
            PL_WARN("[MANAGER] Immediate write failed: queueing message " << msg.id);
        }
        return enqueue_(std::move(msg));
    }

    // -------------------------------------------------------------------------
    // Subscriptions
    // -------------------------------------------------------------------------
    //
    // Registers listener on topic (frames whose type equals topic) and
    // connects if currently Disconnected. A topic's first listener is
    // announced to the server at once when Connected, otherwise on the next
    // connection. Dropping a topic's last listener (Subscription::unsubscribe)
    // is announced by the next poll().
    //
    [[nodiscard]]
    inline Subscription subscribe(std::string topic, ListenerPtr listener) {
        if (!listener || !*listener) {
            PL_ERROR("[MANAGER] subscribe('" << topic << "') called without a listener. Ignoring.");
            return Subscription{};
        }
        Subscription sub = registry_.add(std::move(topic), std::move(listener));
        update_policy_();
        if (machine_.state() == core::connection::State::Disconnected) {
            (void)connect(); // demand-driven, edge-triggered
        }
        else if (machine_.state() == core::connection::State::Connected) {
            sync_topics_();
            publish_transitions_();
        }
        return sub;
    }

    [[nodiscard]]
    inline Subscription subscribe(std::string topic, Listener listener) {
        return subscribe(std::move(topic), std::make_shared<const Listener>(std::move(listener)));
    }

    // -------------------------------------------------------------------------
    // Observers
    // -------------------------------------------------------------------------

    // Registers a status observer and replays the current status to it.
    // Returns a token for unobserve().
    //
    // Called from inside a status notification, the observer joins once the
    // pending transitions are published and then receives the status current
    // at that point: it never sees a status older than its replay.
    inline std::uint64_t observe(StatusListener listener) {
        const std::uint64_t token = observer_ids_.next();
        auto ptr = std::make_shared<const StatusListener>(std::move(listener));
        if (publishing_) {
            joining_observers_.push_back(Observer{token, ptr});
            return token;
        }
        observers_.push_back(Observer{token, ptr});
        notify_(*ptr, machine_.status());
        return token;
    }

    inline void unobserve(std::uint64_t token) {
        const auto match = [token](const Observer& o) { return o.token == token; };
        std::erase_if(observers_, match);
        std::erase_if(joining_observers_, match);
    }

    // Invoked for every message lost to queue overflow
    inline void on_queue_overflow(OverflowListener listener) {
        overflow_listeners_.push_back(std::make_shared<const OverflowListener>(std::move(listener)));
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------
    inline void poll() {
        // === Environment changes ===
        core::environment::Change change;
        while (signals_.poll(change)) {
            on_environment_change_(change);
        }
        // === Reconnect policy (subscriptions may have changed) ===
        update_policy_();
        // === Transport events and timers ===
        machine_.poll([this](std::string_view bytes) {
            on_frame_(bytes);
        });
        // === Topics added or dropped since the last announcement ===
        if (machine_.state() == core::connection::State::Connected) {
            sync_topics_();
        }
        // === Messages re-queued by a failed immediate write ===
        if (machine_.state() == core::connection::State::Connected && !queue_.empty()) {
            drain_();
        }
        // === Observers and queue drain ===
        publish_transitions_();
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Status status() const {
        return machine_.status();
    }

    [[nodiscard]]
    inline std::size_t queue_depth() const noexcept {
        return queue_.size();
    }

    [[nodiscard]]
    inline std::uint64_t dropped_messages() const noexcept {
        return queue_.dropped();
    }

    [[nodiscard]]
    inline const core::queue::OutboundQueue& queue() const noexcept {
        return queue_;
    }

    [[nodiscard]]
    inline std::uint64_t rx_messages() const noexcept {
        return machine_.rx_messages();
    }

    [[nodiscard]]
    inline std::uint64_t tx_messages() const noexcept {
        return machine_.tx_messages();
    }

    [[nodiscard]]
    inline core::time_point last_inbound() const noexcept {
        return machine_.last_inbound();
    }

    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return machine_.epoch();
    }

    [[nodiscard]]
    inline std::vector<std::string> active_topics() const {
        return registry_.topics();
    }

    // Topics announced to the server on the current connection
    [[nodiscard]]
    inline const std::set<std::string, std::less<>>& announced_topics() const noexcept {
        return announced_;
    }

    [[nodiscard]]
    inline bool has_demand() const noexcept {
        return !registry_.empty();
    }

    [[nodiscard]]
    inline std::uint64_t listener_failures() const noexcept {
        return listener_failures_;
    }

    [[nodiscard]]
    inline const core::Config& config() const noexcept {
        return config_;
    }

    [[nodiscard]]
    inline const core::telemetry::Connection& telemetry() const noexcept {
        return telemetry_;
    }

    [[nodiscard]]
    inline const Machine& machine() const noexcept {
        return machine_;
    }

private:
    struct Observer {
        std::uint64_t token;
        std::shared_ptr<const StatusListener> listener;
    };

    core::Config config_;
    core::Error config_error_;
    core::environment::Signals& signals_;
    Clock& clock_;

    Codec codec_{};
    core::telemetry::Connection telemetry_{};
    Machine machine_;
    core::queue::OutboundQueue queue_;
    core::subscription::Registry registry_;

    std::vector<Observer> observers_;
    std::vector<Observer> joining_observers_;   // registered while publishing
    std::vector<std::shared_ptr<const OverflowListener>> overflow_listeners_;
    lcr::sequence observer_ids_{1};

    // Outbound message ids: <per-manager prefix>-<sequence>
    std::string id_prefix_;
    lcr::sequence message_ids_{1};

    // Topics the server was told about, valid for connection epoch announced_epoch_
    std::set<std::string, std::less<>> announced_;
    std::uint64_t announced_epoch_{0};

    bool user_disconnected_{false};   // set by disconnect(), cleared by connect()
    bool publishing_{false};
    std::uint64_t listener_failures_{0};

private:
    [[nodiscard]]
    inline std::string next_message_id_() {
        std::string id = id_prefix_;
        id += '-';
        lcr::json::append(id, message_ids_.next());
        return id;
    }

    [[nodiscard]]
    static inline std::string make_id_prefix_() {
        std::string prefix;
        lcr::json::append_hex(prefix, std::random_device{}(), 8);
        return prefix;
    }

    [[nodiscard]]
    static inline Frame to_frame_(const OutboundMessage& msg) {
        Frame f;
        f.type = msg.type;
        f.id = msg.id;
        f.payload = msg.payload;
        return f;
    }

    [[nodiscard]]
    inline core::Error enqueue_(OutboundMessage msg) {
        PL_TL1( telemetry_.send_queued_total.inc() );
        OutboundMessage lost;
        const core::queue::PushResult r = queue_.push(std::move(msg), lost);
        if (r == core::queue::PushResult::Queued) {
            return core::Error::None;
        }
        PL_TL1( telemetry_.send_dropped_total.inc() );
        for (const auto& listener : std::vector(overflow_listeners_)) {
            notify_(*listener, lost, queue_.size());
        }
        return (r == core::queue::PushResult::EvictedOldest) ? core::Error::None : core::Error::QueueOverflow;
    }

    // Writes queued messages in FIFO order; a failed write halts the drain
    // and is handled as an unclean close.
    inline void drain_() {
        if (!queue_.empty()) {
            PL_DEBUG("[MANAGER] Draining " << queue_.size() << " queued message(s)");
        }
        while (!queue_.empty() && machine_.state() == core::connection::State::Connected) {
            const OutboundMessage& msg = queue_.front();
            if (!machine_.write(codec_.encode(to_frame_(msg)))) {
                PL_WARN("[MANAGER] Drain halted at message " << msg.id << " (" << queue_.size() << " left in queue)");
                machine_.fail_connection(core::Error::WriteFailed);
                return;
            }
            queue_.pop_front();
        }
    }

    // Brings the server's view of this client's topics in line with the
    // registry. A new connection starts from an empty view, so every active
    // topic is replayed. A failed write is handled as an unclean close.
    inline void sync_topics_() {
        if (!config_.subscriptions.announce) {
            return;
        }
        if (announced_epoch_ != machine_.epoch()) {
            announced_.clear();
            announced_epoch_ = machine_.epoch();
        }
        for (auto it = announced_.begin(); it != announced_.end();) {
            if (registry_.listener_count(*it) > 0) {
                ++it;
                continue;
            }
            if (!write_control_(config_.subscriptions.unsubscribe_type, *it)) {
                return;
            }
            it = announced_.erase(it);
        }
        for (const std::string& topic : registry_.topics()) {
            if (announced_.contains(topic)) {
                continue;
            }
            if (!write_control_(config_.subscriptions.subscribe_type, topic)) {
                return;
            }
            announced_.insert(topic);
        }
    }

    [[nodiscard]]
    inline bool write_control_(const std::string& type, std::string_view topic) {
        Frame f;
        f.type = type;
        f.payload = "{\"topic\":";
        lcr::json::append_quoted(f.payload, topic);
        f.payload += '}';
        if (!machine_.write_control(codec_.encode(f))) {
            PL_WARN("[MANAGER] Could not announce " << type << " '" << topic << "'");
            machine_.fail_connection(core::Error::WriteFailed);
            return false;
        }
        PL_DEBUG("[MANAGER] Announced " << type << " '" << topic << "'");
        PL_TL1( telemetry_.control_frames_total.inc() );
        return true;
    }

    inline void update_policy_() {
        machine_.set_reconnect_permitted(signals_.foreground() && signals_.network_reachable() && has_demand());
    }

    [[nodiscard]]
    inline bool auto_connect_allowed_() const noexcept {
        const core::Error last = machine_.status().last_error_code;
        return machine_.state() == core::connection::State::Disconnected
            && !user_disconnected_
            && has_demand()
            && signals_.foreground()
            && signals_.network_reachable()
            && config_error_ == core::Error::None
            && last != core::Error::MaxAttemptsExceeded
            && last != core::Error::CredentialUnavailable;
    }

    inline void on_environment_change_(const core::environment::Change& change) {
        PL_INFO("[ENV] " << core::environment::to_string(change.signal) << " -> " << (change.value ? "true" : "false"));
        update_policy_();

        if (change.signal == core::environment::Signal::NetworkReachable && !change.value) {
            machine_.abandon_attempt(core::Error::NetworkUnreachable);
        }
        if (change.value && auto_connect_allowed_()) {
            PL_DEBUG("[MANAGER] Environment allows connecting: connecting now");
            (void)machine_.connect();
        }
        publish_transitions_();
    }

    inline void on_frame_(std::string_view bytes) {
        Frame frame;
        const core::codec::Result r = codec_.decode(bytes, frame);
        if (r != core::codec::Result::Ok) {
            PL_WARN("[CODEC] Dropping inbound frame (" << core::codec::to_string(r) << ")");
            PL_TL1( telemetry_.decode_failures_total.inc() );
            return;
        }
        if (frame.type == core::HEARTBEAT_REPLY_TYPE) {
            PL_TRACE("[MANAGER] Heartbeat reply received");
            return;
        }
        const core::subscription::DispatchResult res = registry_.dispatch(frame);
        PL_TL1( telemetry_.messages_dispatched_total.inc() );
        if (res.failed > 0) {
            listener_failures_ += res.failed;
            PL_TL1( telemetry_.listener_failures_total.inc(res.failed) );
        }
    }

    // Publishes recorded transitions in order. On Connected, replays the
    // active topics and drains the queue before observers are told.
    inline void publish_transitions_() {
        if (publishing_) {
            return; // the outer loop picks up transitions recorded by observers
        }
        publishing_ = true;
        core::connection::Transition t;
        while (machine_.poll_transition(t)) {
            if (t.to == core::connection::State::Connected
                && t.generation == machine_.generation()
                && machine_.state() == core::connection::State::Connected) {
                sync_topics_();
                drain_();
            }
            const auto snapshot = observers_;
            for (const Observer& o : snapshot) {
                notify_(*o.listener, t.status);
            }
        }
        publishing_ = false;

        // Observers registered during the loop: replay the settled status
        if (!joining_observers_.empty()) {
            std::vector<Observer> joining;
            joining.swap(joining_observers_);
            for (const Observer& o : joining) {
                observers_.push_back(o);
            }
            const Status current = machine_.status();
            for (const Observer& o : joining) {
                notify_(*o.listener, current);
            }
            // Transitions recorded by those replays
            publish_transitions_();
        }
    }

    template<class Fn, class... Args>
    inline void notify_(const Fn& fn, const Args&... args) {
        try {
            fn(args...);
        }
        catch (const std::exception& e) {
            ++listener_failures_;
            PL_TL1( telemetry_.listener_failures_total.inc() );
            PL_ERROR("[MANAGER] Observer threw: " << e.what());
        }
        catch (...) {
            ++listener_failures_;
            PL_TL1( telemetry_.listener_failures_total.inc() );
            PL_ERROR("[MANAGER] Observer threw a non-standard exception");
        }
    }
};

} // namespace pulselink
