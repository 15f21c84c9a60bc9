#pragma once

#include <array>
#include <cstddef>
#include <utility>


namespace lcr {
namespace local {

//------------------------------------------------------------------------------
// Single-threaded fixed-capacity ring buffer.
//
// Characteristics:
//   • O(1) push/pop operations (no dynamic allocations of its own)
//   • Power-of-two capacity for modulo-free wraparound
//   • Two overflow modes:
//       - push()           rejects the new element when full
//       - push_overwrite() evicts the oldest element when full
//
// Thread-safety:
//   - NOT thread-safe. Must only be used from a single thread.
//   - For cross-thread state hand-off, use lockfree::slot::last_value.
//
// Template parameters:
//   T         - element type stored in the buffer (default constructible)
//   Capacity  - must be a power of two and >= 2 (usable size is Capacity-1)
//------------------------------------------------------------------------------
template <typename T, std::size_t Capacity>
class ring_buffer {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");

public:
    ring_buffer() = default;
    ~ring_buffer() = default;

    // Non-copyable / non-movable
    ring_buffer(const ring_buffer&) = delete;
    ring_buffer& operator=(const ring_buffer&) = delete;

    inline bool push(T item) {
        const std::size_t next = (head_ + 1) & MASK;
        if (next == tail_) [[unlikely]]
            return false; // full
        buffer_[head_] = std::move(item);
        head_ = next;
        return true;
    }

    // Returns true if an element had to be evicted to make room
    inline bool push_overwrite(T item) {
        bool evicted = false;
        if (full()) [[unlikely]] {
            tail_ = (tail_ + 1) & MASK;
            evicted = true;
        }
        buffer_[head_] = std::move(item);
        head_ = (head_ + 1) & MASK;
        return evicted;
    }

    inline bool pop(T& out) {
        if (tail_ == head_) [[unlikely]]
            return false; // empty
        out = std::move(buffer_[tail_]);
        buffer_[tail_] = T{};
        tail_ = (tail_ + 1) & MASK;
        return true;
    }

    inline bool empty() const noexcept { return head_ == tail_; }

    inline bool full() const noexcept {
        return ((head_ + 1) & MASK) == tail_;
    }

    inline constexpr std::size_t capacity() const noexcept { return Capacity - 1; }

    inline std::size_t size() const noexcept {
        return (head_ - tail_) & MASK;
    }

    inline void clear() {
        while (!empty()) {
            buffer_[tail_] = T{};
            tail_ = (tail_ + 1) & MASK;
        }
        head_ = tail_ = 0;
    }

private:
    static constexpr std::size_t MASK = Capacity - 1;
    std::array<T, Capacity> buffer_{};
    std::size_t head_{0};
    std::size_t tail_{0};
};


} // namespace local
} // namespace lcr
