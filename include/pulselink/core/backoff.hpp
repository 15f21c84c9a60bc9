#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

#include "pulselink/core/config.hpp"


namespace pulselink::core::backoff {

// -----------------------------------------------------------------------------
// Reconnect delay for attempt n (1-indexed):
//
//     delay(n) = min(base_delay * 2^(n-1), max_delay)
//
// Pure function of the attempt number and the configuration. The exponent is
// clamped so that large attempt numbers cannot overflow.
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::chrono::milliseconds delay(std::uint32_t attempt, const BackoffConfig& cfg) noexcept {
    if (attempt == 0) {
        attempt = 1;
    }
    const std::uint32_t exponent = std::min<std::uint32_t>(attempt - 1, 30);
    const auto base = cfg.base_delay.count();
    const auto cap  = cfg.max_delay.count();
    if (base <= 0) {
        return std::chrono::milliseconds{0};
    }
    // base * 2^exponent would exceed the cap: stop before multiplying
    if (exponent >= 62 || base > (cap >> exponent)) {
        return cfg.max_delay;
    }
    return std::chrono::milliseconds{std::min<std::int64_t>(base << exponent, cap)};
}

// -----------------------------------------------------------------------------
// Applies symmetric jitter of +/- jitter_ratio to a computed delay.
// The result is never negative and never exceeds max_delay.
// -----------------------------------------------------------------------------
template<class URBG>
[[nodiscard]]
inline std::chrono::milliseconds jittered(std::chrono::milliseconds d, const BackoffConfig& cfg, URBG& rng) {
    if (cfg.jitter_ratio <= 0.0 || d.count() == 0) {
        return std::min(d, cfg.max_delay);
    }
    std::uniform_real_distribution<double> dist(-cfg.jitter_ratio, cfg.jitter_ratio);
    const double scaled = static_cast<double>(d.count()) * (1.0 + dist(rng));
    const auto ms = static_cast<std::int64_t>(scaled);
    return std::clamp(std::chrono::milliseconds{ms}, std::chrono::milliseconds{0}, cfg.max_delay);
}

} // namespace pulselink::core::backoff
