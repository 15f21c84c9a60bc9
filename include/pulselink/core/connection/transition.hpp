#pragma once

#include <cstdint>

#include "pulselink/core/connection/state.hpp"
#include "pulselink/core/connection/status.hpp"


namespace pulselink::core::connection {

// -----------------------------------------------------------------------------
// Transition
//
// Record of one state change, produced by the state machine and drained by
// the owner (Manager) with poll_transition(). Carries the full status as it
// was right after the change, so observers see every intermediate value even
// when several transitions happen within one poll().
// -----------------------------------------------------------------------------
struct Transition {
    State from{State::Disconnected};
    State to{State::Disconnected};
    Event event{Event::DisconnectRequested};
    std::uint64_t generation{0};
    Status status{};
};

} // namespace pulselink::core::connection
