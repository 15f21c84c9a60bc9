#pragma once

#include <chrono>
#include <concepts>


namespace pulselink::core {

using time_point = std::chrono::steady_clock::time_point;

// -----------------------------------------------------------------------------
// ClockConcept
// -----------------------------------------------------------------------------
//
// Time source consulted by every deadline in the core (connect timeout,
// heartbeat, reconnect delay). Production code uses SteadyClock; tests inject
// a manually advanced clock so that no test ever sleeps.
//
// -----------------------------------------------------------------------------
template<class C>
concept ClockConcept =
    requires(const C& c) {
        { c.now() } noexcept -> std::same_as<time_point>;
    };


struct SteadyClock {
    [[nodiscard]]
    inline time_point now() const noexcept {
        return std::chrono::steady_clock::now();
    }
};

static_assert(ClockConcept<SteadyClock>);

} // namespace pulselink::core
