/*
================================================================================
pulselink configuration
================================================================================

Runtime configuration of a Manager instance plus the compile-time constants
shared by the connection core.

All durations are milliseconds. Defaults:

  backoff.base_delay        5000 ms
  backoff.max_delay        30000 ms
  backoff.max_attempts        10
  backoff.jitter_ratio       0.0   (disabled)
  connect_timeout          10000 ms
  heartbeat.interval       30000 ms
  heartbeat.max_missed         2   (intervals without inbound traffic)
  queue.capacity             100
  queue.overflow      DropOldest
  subscriptions.announce    true   ("subscribe" / "unsubscribe" frames)
================================================================================
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "pulselink/core/error.hpp"


namespace pulselink::core {

// Capacity of the transition ring between the state machine and the manager
inline constexpr std::size_t TRANSITION_RING_CAPACITY = 32;

// Reserved frame types of the liveness protocol
inline constexpr std::string_view HEARTBEAT_PROBE_TYPE = "ping";
inline constexpr std::string_view HEARTBEAT_REPLY_TYPE = "pong";

// WebSocket close codes
inline constexpr std::uint16_t CLOSE_NORMAL          = 1000;
inline constexpr std::uint16_t CLOSE_ABNORMAL        = 1006;
inline constexpr std::uint16_t CLOSE_LIVENESS_FAILED = 4000;
inline constexpr std::uint16_t CLOSE_WRITE_FAILED    = 4001;
inline constexpr std::uint16_t CLOSE_OPEN_TIMEOUT    = 4002;
inline constexpr std::uint16_t CLOSE_TRANSPORT_ERROR = 4003;
inline constexpr std::uint16_t CLOSE_ABANDONED       = 4004;


// Policy applied when send() hits a full outbound queue
enum class OverflowPolicy : std::uint8_t {
    DropOldest,   // evict the oldest queued message, admit the new one
    DropNewest,   // keep the queue as is, drop the new message
    Reject        // keep the queue as is, report Error::QueueOverflow
};

[[nodiscard]]
inline constexpr std::string_view to_string(OverflowPolicy p) noexcept {
    switch (p) {
        case OverflowPolicy::DropOldest: return "DropOldest";
        case OverflowPolicy::DropNewest: return "DropNewest";
        case OverflowPolicy::Reject:     return "Reject";
        default:                         return "Unknown";
    }
}


struct BackoffConfig {
    std::chrono::milliseconds base_delay{5000};
    std::chrono::milliseconds max_delay{30000};
    std::uint32_t max_attempts{10};
    double jitter_ratio{0.0};  // 0 disables jitter; result always clamped to [0, max_delay]
};

struct HeartbeatConfig {
    std::chrono::milliseconds interval{30000};
    std::uint32_t max_missed{2};
};

struct QueueConfig {
    std::size_t capacity{100};
    OverflowPolicy overflow{OverflowPolicy::DropOldest};
};

// Control frames telling the server which topics this client listens to:
//     {"type":"<subscribe_type>","payload":{"topic":"<topic>"}}
struct SubscriptionConfig {
    bool announce{true};
    std::string subscribe_type{"subscribe"};
    std::string unsubscribe_type{"unsubscribe"};
};

struct Config {
    std::string url;                       // ws:// or wss:// base endpoint
    std::string platform{"native"};        // platform identifier (query parameter)
    std::string tenant_id;                 // optional tenant (query parameter when non-empty)

    BackoffConfig backoff{};
    std::chrono::milliseconds connect_timeout{10000};
    HeartbeatConfig heartbeat{};
    QueueConfig queue{};
    SubscriptionConfig subscriptions{};
};

// Returns Error::None if the configuration is usable, otherwise the first
// problem found (InvalidUrl or InvalidConfig). The reason is logged.
[[nodiscard]]
Error validate(const Config& cfg);

} // namespace pulselink::core
