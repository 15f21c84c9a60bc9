#pragma once

#include <atomic>
#include <type_traits>
#include <cstdint>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// counter - A monotonically increasing counter (cumulative metric)
// Relaxed ordering: counters are observational, never used for synchronization.
// ---------------------------------------------------------------------------
template<typename T = std::uint64_t>
struct counter {
    counter() = default;
    explicit counter(T initial) noexcept : value_(initial) {}
    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    inline void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
    inline void reset() noexcept { value_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<T> value_{0};
};

using counter32 = counter<std::uint32_t>;
using counter64 = counter<std::uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");

} // namespace atomic
} // namespace metrics
} // namespace lcr
