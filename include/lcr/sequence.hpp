#pragma once

#include <cstdint>


namespace lcr {

// Monotonic sequence number generator (single-threaded).
// Values are never reused for the lifetime of the generator.
class sequence {
    std::uint64_t next_seq_;

public:
    explicit constexpr sequence(std::uint64_t start = 1) noexcept : next_seq_(start) {}
    // Disable copy semantics: two copies would hand out the same values
    sequence(const sequence&) = delete;
    sequence& operator=(const sequence&) = delete;

    // Return next sequence number and increment
    inline std::uint64_t next() noexcept {
        return next_seq_++;
    }

    // Peek at the value next() will return
    [[nodiscard]]
    inline std::uint64_t current() const noexcept {
        return next_seq_;
    }
};

} // namespace lcr
