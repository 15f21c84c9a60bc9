#include "pulselink/core/queue/outbound_queue.hpp"

#include <utility>

#include "lcr/log/logger.hpp"


namespace pulselink::core::queue {

OutboundQueue::OutboundQueue(std::size_t capacity, OverflowPolicy policy)
    : capacity_(capacity == 0 ? 1 : capacity)
    , policy_(policy)
{
}

PushResult OutboundQueue::push(OutboundMessage msg, OutboundMessage& lost) {
    if (items_.size() < capacity_) [[likely]] {
        items_.push_back(std::move(msg));
        PL_TRACE("[QUEUE] Queued message " << items_.back().id << " (depth " << items_.size() << ")");
        return PushResult::Queued;
    }

    ++dropped_;
    switch (policy_) {
        case OverflowPolicy::DropOldest:
            lost = std::move(items_.front());
            items_.pop_front();
            items_.push_back(std::move(msg));
            PL_WARN("[QUEUE] Outbound queue full (" << capacity_ << "): dropped oldest message "
                 << lost.id << " (type '" << lost.type << "')");
            return PushResult::EvictedOldest;

        case OverflowPolicy::DropNewest:
            lost = std::move(msg);
            PL_WARN("[QUEUE] Outbound queue full (" << capacity_ << "): dropped new message "
                 << lost.id << " (type '" << lost.type << "')");
            return PushResult::DroppedNewest;

        case OverflowPolicy::Reject:
        default:
            lost = std::move(msg);
            PL_WARN("[QUEUE] Outbound queue full (" << capacity_ << "): rejected message "
                 << lost.id << " (type '" << lost.type << "')");
            return PushResult::Rejected;
    }
}

void OutboundQueue::pop_front() {
    items_.pop_front();
}

void OutboundQueue::clear() noexcept {
    items_.clear();
}

} // namespace pulselink::core::queue
