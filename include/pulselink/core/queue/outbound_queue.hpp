#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>

#include "pulselink/core/clock.hpp"
#include "pulselink/core/config.hpp"


namespace pulselink::core::queue {

// Message waiting for a connection
struct OutboundMessage {
    std::string id;            // unique, assigned at send(), never reused
    std::string type;
    std::string payload;       // raw JSON text (may be empty)
    time_point enqueued_at{};
};

enum class PushResult : std::uint8_t {
    Queued,          // admitted, nothing lost
    EvictedOldest,   // admitted, oldest entry dropped (DropOldest)
    DroppedNewest,   // not admitted (DropNewest)
    Rejected         // not admitted (Reject)
};

[[nodiscard]]
inline constexpr std::string_view to_string(PushResult r) noexcept {
    switch (r) {
        case PushResult::Queued:        return "Queued";
        case PushResult::EvictedOldest: return "EvictedOldest";
        case PushResult::DroppedNewest: return "DroppedNewest";
        case PushResult::Rejected:      return "Rejected";
        default:                        return "Unknown";
    }
}

/*
===============================================================================
 queue::OutboundQueue
===============================================================================

Bounded FIFO of messages that could not be written immediately.

  - Insertion order == send order; drained strictly front to back.
  - size() never exceeds capacity().
  - On overflow the configured OverflowPolicy decides what is lost. With the
    default DropOldest policy the queue always retains the most recent
    capacity() messages. Every lost message is counted in dropped().

Not thread-safe: owned and used by the Manager's owner thread.
===============================================================================
*/
class OutboundQueue {
public:
    using const_iterator = std::deque<OutboundMessage>::const_iterator;

    OutboundQueue(std::size_t capacity, OverflowPolicy policy);

    // Appends msg. When the result is not Queued, lost receives the message
    // that did not survive (the evicted oldest, or msg itself).
    [[nodiscard]]
    PushResult push(OutboundMessage msg, OutboundMessage& lost);

    // Precondition: !empty()
    [[nodiscard]]
    inline const OutboundMessage& front() const noexcept {
        return items_.front();
    }

    // Precondition: !empty()
    void pop_front();

    void clear() noexcept;

    [[nodiscard]]
    inline bool empty() const noexcept {
        return items_.empty();
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return items_.size();
    }

    [[nodiscard]]
    inline std::size_t capacity() const noexcept {
        return capacity_;
    }

    [[nodiscard]]
    inline OverflowPolicy policy() const noexcept {
        return policy_;
    }

    // Messages lost to overflow since construction
    [[nodiscard]]
    inline std::uint64_t dropped() const noexcept {
        return dropped_;
    }

    [[nodiscard]]
    inline const_iterator begin() const noexcept {
        return items_.begin();
    }

    [[nodiscard]]
    inline const_iterator end() const noexcept {
        return items_.end();
    }

private:
    std::deque<OutboundMessage> items_;
    std::size_t capacity_;
    OverflowPolicy policy_;
    std::uint64_t dropped_{0};
};

} // namespace pulselink::core::queue
