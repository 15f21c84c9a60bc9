#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string_view>

#include "pulselink/core/clock.hpp"


namespace pulselink::core::timer {

/*
===============================================================================
 timer::Table
===============================================================================

Deadline table for the three timers owned by a connection attempt.

  - Exactly one slot per Kind: arming a kind replaces (cancels) the previous
    instance of that kind.
  - Every armed timer carries the generation of the connection attempt that
    armed it. A timer whose generation no longer matches the current one is
    stale: pop_expired() discards it without reporting it.
  - Nothing runs in the background. The owner polls the table with the
    current time and reacts to what it returns.

This replaces "clear the old handle" bookkeeping with a staleness check that
also covers timers armed by an attempt that has since been abandoned.
===============================================================================
*/

enum class Kind : std::uint8_t {
    ConnectTimeout = 0,
    Heartbeat      = 1,
    ReconnectDelay = 2
};

inline constexpr std::size_t KIND_COUNT = 3;

[[nodiscard]]
inline constexpr std::string_view to_string(Kind k) noexcept {
    switch (k) {
        case Kind::ConnectTimeout: return "ConnectTimeout";
        case Kind::Heartbeat:      return "Heartbeat";
        case Kind::ReconnectDelay: return "ReconnectDelay";
        default:                   return "Unknown";
    }
}


class Table {
public:
    inline void arm(Kind kind, time_point deadline, std::uint64_t generation) noexcept {
        Slot& s = slot_(kind);
        s.armed = true;
        s.deadline = deadline;
        s.generation = generation;
    }

    inline void cancel(Kind kind) noexcept {
        slot_(kind) = Slot{};
    }

    inline void cancel_all() noexcept {
        slots_.fill(Slot{});
    }

    [[nodiscard]]
    inline bool armed(Kind kind) const noexcept {
        return slot_(kind).armed;
    }

    [[nodiscard]]
    inline std::size_t armed_count() const noexcept {
        std::size_t n = 0;
        for (const Slot& s : slots_) {
            n += s.armed ? 1 : 0;
        }
        return n;
    }

    [[nodiscard]]
    inline time_point deadline(Kind kind) const noexcept {
        return slot_(kind).deadline;
    }

    // Pops one due timer of the current generation (earliest deadline first).
    // Stale timers encountered on the way are disarmed and dropped.
    [[nodiscard]]
    inline bool pop_expired(time_point now, std::uint64_t generation, Kind& out) noexcept {
        Slot* best = nullptr;
        std::size_t best_index = 0;
        for (std::size_t i = 0; i < KIND_COUNT; ++i) {
            Slot& s = slots_[i];
            if (!s.armed) {
                continue;
            }
            if (s.generation != generation) {
                s = Slot{}; // stale
                continue;
            }
            if (s.deadline <= now && (best == nullptr || s.deadline < best->deadline)) {
                best = &s;
                best_index = i;
            }
        }
        if (best == nullptr) {
            return false;
        }
        *best = Slot{};
        out = static_cast<Kind>(best_index);
        return true;
    }

private:
    struct Slot {
        bool armed{false};
        time_point deadline{};
        std::uint64_t generation{0};
    };

    inline Slot& slot_(Kind kind) noexcept {
        return slots_[static_cast<std::size_t>(kind)];
    }

    inline const Slot& slot_(Kind kind) const noexcept {
        return slots_[static_cast<std::size_t>(kind)];
    }

    std::array<Slot, KIND_COUNT> slots_{};
};

} // namespace pulselink::core::timer
