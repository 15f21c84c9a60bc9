#pragma once

#include <cstdint>
#include <string_view>

#include "lcr/lockfree/slot/last_value.hpp"


namespace pulselink::core::environment {

enum class Signal : std::uint8_t {
    Foreground,        // application foreground state
    NetworkReachable   // network reachability
};

[[nodiscard]]
inline constexpr std::string_view to_string(Signal s) noexcept {
    switch (s) {
        case Signal::Foreground:       return "Foreground";
        case Signal::NetworkReachable: return "NetworkReachable";
        default:                       return "Unknown";
    }
}

// One observed change of an environment condition
struct Change {
    Signal signal{Signal::Foreground};
    bool value{true};
};

/*
===============================================================================
 environment::Signals
===============================================================================

Entry point for platform notifications (app lifecycle, reachability).

  - set_foreground() / set_network_reachable() may be called from any ONE
    platform thread (single writer). Each condition is a last_value slot:
    a write overwrites the previous one and never fails.
  - The owner loop calls poll() until it returns false. Each call reports at
    most one Change per condition, carrying the newest value written since
    the previous observation, and updates the owner-side view returned by
    foreground() / network_reachable().

Bursts are coalesced: after any number of writes the owner always ends up
with the last value the platform reported.

Both conditions start out true unless told otherwise.
===============================================================================
*/
class Signals {
public:
    explicit Signals(bool foreground = true, bool network_reachable = true) noexcept
        : foreground_slot_(foreground)
        , network_slot_(network_reachable)
        , foreground_(foreground)
        , network_reachable_(network_reachable) {
    }

    Signals(const Signals&) = delete;
    Signals& operator=(const Signals&) = delete;

    // --- Writer side (platform thread) -------------------------------------

    inline void set_foreground(bool value) noexcept {
        foreground_slot_.store(value);
    }

    inline void set_network_reachable(bool value) noexcept {
        network_slot_.store(value);
    }

    // --- Reader side (owner loop) ------------------------------------------

    [[nodiscard]]
    inline bool poll(Change& out) noexcept {
        bool value;
        if (foreground_slot_.load_if_updated(value, foreground_epoch_)) {
            foreground_ = value;
            out = Change{Signal::Foreground, value};
            return true;
        }
        if (network_slot_.load_if_updated(value, network_epoch_)) {
            network_reachable_ = value;
            out = Change{Signal::NetworkReachable, value};
            return true;
        }
        return false;
    }

    [[nodiscard]]
    inline bool foreground() const noexcept {
        return foreground_;
    }

    [[nodiscard]]
    inline bool network_reachable() const noexcept {
        return network_reachable_;
    }

    // True when a write has not been observed by poll() yet
    [[nodiscard]]
    inline bool pending() const noexcept {
        return foreground_slot_.epoch() != foreground_epoch_
            || network_slot_.epoch() != network_epoch_;
    }

private:
    lcr::lockfree::slot::last_value<bool> foreground_slot_;
    lcr::lockfree::slot::last_value<bool> network_slot_;

    // Owner-side view (updated by poll)
    bool foreground_;
    bool network_reachable_;
    std::uint64_t foreground_epoch_{0};
    std::uint64_t network_epoch_{0};
};

} // namespace pulselink::core::environment
