#pragma once

#include <cstdint>
#include <string_view>

namespace pulselink::core {

/*
===============================================================================
 pulselink::core::Error
===============================================================================

Failure classification for the connection core.

Transport- and timer-originated errors are recovered locally by the
connection state machine and surface only through the observable status
(last_error / last_error_code). They are never thrown.

Only two values require explicit caller action:
  - CredentialUnavailable  (re-authenticate, then connect())
  - MaxAttemptsExceeded    (connect() manually)
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Caller / contract errors -------------------------------------------
    InvalidUrl,            // Malformed or unsupported endpoint URL
    InvalidConfig,         // Config rejected by validate()
    InvalidState,          // Operation not allowed in the current state

    // --- Credentials ---------------------------------------------------------
    CredentialUnavailable, // No session / token; never retried automatically

    // --- Transport lifecycle (retryable) -------------------------------------
    TransportOpenFailed,   // Open failed before the connection was established
    OpenTimeout,           // Open not confirmed within the connect timeout
    TransportClosed,       // Unclean close (code != normal closure)
    LivenessTimeout,       // Consecutive heartbeat intervals without inbound traffic
    WriteFailed,           // Frame could not be written (send or drain)

    // --- Policy -----------------------------------------------------------------
    NetworkUnreachable,    // In-flight attempt abandoned: network lost
    ReconnectSuspended,    // Reconnect forbidden (background, offline, no demand)
    MaxAttemptsExceeded,   // Terminal until connect() is called again

    // --- Informational --------------------------------------------------------
    QueueOverflow,         // Outbound queue at capacity
    ProtocolError,         // Inbound frame not decodable, or outbound payload not JSON
    ListenerFailure,       // A listener threw during dispatch
};


[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                  return "None";
    case Error::InvalidUrl:            return "InvalidUrl";
    case Error::InvalidConfig:         return "InvalidConfig";
    case Error::InvalidState:          return "InvalidState";
    case Error::CredentialUnavailable: return "CredentialUnavailable";
    case Error::TransportOpenFailed:   return "TransportOpenFailed";
    case Error::OpenTimeout:           return "OpenTimeout";
    case Error::TransportClosed:       return "TransportClosed";
    case Error::LivenessTimeout:       return "LivenessTimeout";
    case Error::WriteFailed:           return "WriteFailed";
    case Error::NetworkUnreachable:    return "NetworkUnreachable";
    case Error::ReconnectSuspended:    return "ReconnectSuspended";
    case Error::MaxAttemptsExceeded:   return "MaxAttemptsExceeded";
    case Error::QueueOverflow:         return "QueueOverflow";
    case Error::ProtocolError:         return "ProtocolError";
    case Error::ListenerFailure:       return "ListenerFailure";
    default:                           return "Unknown";
    }
}

// Human-readable message published as Status::last_error
[[nodiscard]]
inline constexpr std::string_view describe(Error err) noexcept {
    switch (err) {
    case Error::None:                  return "";
    case Error::InvalidUrl:            return "invalid url";
    case Error::InvalidConfig:         return "invalid configuration";
    case Error::InvalidState:          return "operation not allowed in current state";
    case Error::CredentialUnavailable: return "access token unavailable";
    case Error::TransportOpenFailed:   return "transport open failed";
    case Error::OpenTimeout:           return "connect timeout";
    case Error::TransportClosed:       return "connection closed unexpectedly";
    case Error::LivenessTimeout:       return "heartbeat timeout";
    case Error::WriteFailed:           return "write failed";
    case Error::NetworkUnreachable:    return "network unreachable";
    case Error::ReconnectSuspended:    return "reconnect suspended";
    case Error::MaxAttemptsExceeded:   return "max reconnect attempts exceeded";
    case Error::QueueOverflow:         return "outbound queue overflow";
    case Error::ProtocolError:         return "invalid frame";
    case Error::ListenerFailure:       return "listener failure";
    default:                           return "unknown error";
    }
}

// Whether a failure is eligible for the backoff reconnect cycle.
// Caller misuse, missing credentials and terminal states are never retried.
[[nodiscard]]
inline constexpr bool is_retryable(Error err) noexcept {
    switch (err) {
    case Error::TransportOpenFailed:
    case Error::OpenTimeout:
    case Error::TransportClosed:
    case Error::LivenessTimeout:
    case Error::WriteFailed:
        return true;
    default:
        return false;
    }
}

} // namespace pulselink::core
