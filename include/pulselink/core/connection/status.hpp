#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include "pulselink/core/connection/state.hpp"
#include "pulselink/core/error.hpp"
#include "lcr/optional.hpp"


namespace pulselink::core::connection {

// -----------------------------------------------------------------------------
// Status
//
// Observable value of the connection. Published to observers on every
// transition and replayed to each new observer.
//
// Invariant: connection_id.has() == (state == State::Connected)
// -----------------------------------------------------------------------------
struct Status {
    State state{State::Disconnected};
    std::uint32_t reconnect_attempts{0};
    std::string last_error;                   // empty = no error
    Error last_error_code{Error::None};
    lcr::optional<std::string> connection_id;

    [[nodiscard]]
    inline bool is_connected() const noexcept {
        return state == State::Connected;
    }

    // True while a connection attempt is in flight
    [[nodiscard]]
    inline bool is_connecting() const noexcept {
        return state == State::Connecting;
    }

    [[nodiscard]]
    inline bool is_reconnecting() const noexcept {
        return state == State::Reconnecting;
    }

    friend inline bool operator==(const Status& a, const Status& b) {
        return a.state == b.state
            && a.reconnect_attempts == b.reconnect_attempts
            && a.last_error == b.last_error
            && a.last_error_code == b.last_error_code
            && a.connection_id == b.connection_id;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Status& s) {
    os << "{state=" << to_string(s.state)
       << ", attempts=" << s.reconnect_attempts
       << ", connection_id=" << lcr::to_string(s.connection_id);
    if (!s.last_error.empty()) {
        os << ", last_error='" << s.last_error << "' (" << to_string(s.last_error_code) << ")";
    }
    os << "}";
    return os;
}

} // namespace pulselink::core::connection
