#include "pulselink/core/subscription/registry.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "lcr/log/logger.hpp"


namespace pulselink::core::subscription {

namespace {

// Removes listener from topic; drops the topic entry once it is empty
bool erase_listener(detail::Table& table, std::string_view topic, const ListenerPtr& listener) {
    auto it = table.find(topic);
    if (it == table.end()) {
        return false;
    }
    auto& listeners = it->second;
    auto pos = std::find(listeners.begin(), listeners.end(), listener);
    if (pos == listeners.end()) {
        return false;
    }
    listeners.erase(pos);
    if (listeners.empty()) {
        PL_DEBUG("[SUBS] Topic '" << topic << "' has no listeners left");
        table.erase(it);
    }
    return true;
}

} // namespace


// ---------------------------------
// Subscription
// ---------------------------------

void Subscription::unsubscribe() {
    if (!listener_) {
        return; // already unsubscribed
    }
    if (auto table = table_.lock()) {
        if (erase_listener(*table, topic_, listener_)) {
            PL_DEBUG("[SUBS] Unsubscribed from '" << topic_ << "'");
        }
    }
    listener_.reset();
    table_.reset();
}

bool Subscription::active() const noexcept {
    return listener_ != nullptr && !table_.expired();
}


// ---------------------------------
// Registry
// ---------------------------------

Registry::Registry()
    : table_(std::make_shared<detail::Table>())
{
}

Subscription Registry::add(std::string topic, ListenerPtr listener) {
    auto& listeners = (*table_)[topic];
    if (std::find(listeners.begin(), listeners.end(), listener) == listeners.end()) {
        listeners.push_back(listener);
        PL_DEBUG("[SUBS] Subscribed to '" << topic << "' (" << listeners.size() << " listener(s))");
    } else {
        PL_DEBUG("[SUBS] Listener already registered on '" << topic << "'");
    }
    return Subscription{table_, std::move(topic), std::move(listener)};
}

bool Registry::remove(std::string_view topic, const ListenerPtr& listener) {
    return erase_listener(*table_, topic, listener);
}

DispatchResult Registry::dispatch(const codec::Frame& frame) const {
    DispatchResult result;
    auto it = table_->find(frame.type);
    if (it == table_->end()) {
        PL_TRACE("[SUBS] No listener for frame type '" << frame.type << "'");
        return result;
    }
    // Snapshot: listeners may (un)subscribe while being invoked
    const std::vector<ListenerPtr> snapshot = it->second;
    for (const ListenerPtr& listener : snapshot) {
        try {
            (*listener)(frame);
            ++result.delivered;
        }
        catch (const std::exception& e) {
            ++result.failed;
            PL_ERROR("[SUBS] Listener for '" << frame.type << "' threw: " << e.what());
        }
        catch (...) {
            ++result.failed;
            PL_ERROR("[SUBS] Listener for '" << frame.type << "' threw a non-standard exception");
        }
    }
    return result;
}

std::size_t Registry::listener_count(std::string_view topic) const {
    auto it = table_->find(topic);
    return (it == table_->end()) ? 0 : it->second.size();
}

std::vector<std::string> Registry::topics() const {
    std::vector<std::string> out;
    out.reserve(table_->size());
    for (const auto& [topic, listeners] : *table_) {
        out.push_back(topic);
    }
    return out;
}

} // namespace pulselink::core::subscription
