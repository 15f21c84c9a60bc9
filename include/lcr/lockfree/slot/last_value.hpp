/*
================================================================================
 last_value<T>
================================================================================

Lock-free, overwrite-on-write, single-writer storage for state-like values
where freshness matters more than history.

  • store() replaces the previous value; intermediate values may be skipped
  • every store bumps an epoch; a reader keeps the last epoch it saw and
    load_if_updated() reports whether a newer value was published
  • wait-free, O(1), noexcept on both sides

The value itself is held in a std::atomic<T>, so T must be trivially copyable
and a reader never observes a torn value. A reader that sees a new epoch is
guaranteed to read a value at least as recent as the store that produced it
(release on the epoch, acquire on the read).

Not suitable for streams where every update must be delivered.
================================================================================
*/
#pragma once

#include <atomic>
#include <cstdint>
#include <type_traits>


namespace lcr::lockfree::slot {

template <typename T>
class alignas(64) last_value {
    static_assert(std::is_trivially_copyable_v<T>, "last_value<T> requires T to be trivially copyable");

public:
    last_value() noexcept = default;

    explicit last_value(T initial) noexcept
        : value_(initial) {
    }

    last_value(const last_value&) = delete;
    last_value& operator=(const last_value&) = delete;

    // -------------------------------------------------------------------------
    // Writer API (single writer thread)
    // -------------------------------------------------------------------------
    inline void store(T value) noexcept {
        value_.store(value, std::memory_order_relaxed);
        epoch_.fetch_add(1, std::memory_order_release);
    }

    // -------------------------------------------------------------------------
    // Reader API
    // -------------------------------------------------------------------------

    // Loads the value if the epoch moved since last_epoch.
    // On success out and last_epoch are updated and true is returned.
    [[nodiscard]]
    inline bool load_if_updated(T& out, std::uint64_t& last_epoch) const noexcept {
        const std::uint64_t e = epoch_.load(std::memory_order_acquire);
        if (e == last_epoch) {
            return false;
        }
        out = value_.load(std::memory_order_relaxed);
        last_epoch = e;
        return true;
    }

    [[nodiscard]]
    inline T load() const noexcept {
        return value_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return epoch_.load(std::memory_order_acquire);
    }

private:
    alignas(64) std::atomic<T> value_{};
    alignas(64) std::atomic<std::uint64_t> epoch_{0};
};

} // namespace lcr::lockfree::slot
