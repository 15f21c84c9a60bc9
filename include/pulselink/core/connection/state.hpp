#pragma once

#include <cstdint>
#include <string_view>


namespace pulselink::core::connection {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
enum class State : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected: return "Disconnected";
        case State::Connecting:   return "Connecting";
        case State::Connected:    return "Connected";
        case State::Reconnecting: return "Reconnecting";
        default:                  return "Unknown";
    }
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : std::uint8_t {
    // --- User intent ---
    ConnectRequested,
    DisconnectRequested,

    // --- Credentials ---
    CredentialUnavailable,

    // --- Transport lifecycle ---
    TransportOpened,
    TransportOpenFailed,
    TransportClosedClean,     // close code == normal closure
    TransportClosedUnclean,   // any other close code, or transport error

    // --- Timers ---
    ConnectTimeout,
    LivenessExpired,
    RetryTimerExpired,

    // --- Manager decisions ---
    WriteFailed,              // drain could not write a queued frame
    AttemptAbandoned,         // network lost while connecting
    ReconnectDenied           // reconnect policy no longer permits retrying
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::ConnectRequested:       return "ConnectRequested";
        case Event::DisconnectRequested:    return "DisconnectRequested";
        case Event::CredentialUnavailable:  return "CredentialUnavailable";
        case Event::TransportOpened:        return "TransportOpened";
        case Event::TransportOpenFailed:    return "TransportOpenFailed";
        case Event::TransportClosedClean:   return "TransportClosedClean";
        case Event::TransportClosedUnclean: return "TransportClosedUnclean";
        case Event::ConnectTimeout:         return "ConnectTimeout";
        case Event::LivenessExpired:        return "LivenessExpired";
        case Event::RetryTimerExpired:      return "RetryTimerExpired";
        case Event::WriteFailed:            return "WriteFailed";
        case Event::AttemptAbandoned:       return "AttemptAbandoned";
        case Event::ReconnectDenied:        return "ReconnectDenied";
        default:                            return "UnknownEvent";
    }
}

} // namespace pulselink::core::connection
