#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pulselink/core/codec/frame.hpp"


namespace pulselink::core::subscription {

// Listener invoked for every inbound frame whose type equals the topic.
// Identity is the shared_ptr: registering the same pointer twice on a topic
// delivers once.
using Listener    = std::function<void(const codec::Frame&)>;
using ListenerPtr = std::shared_ptr<const Listener>;

namespace detail {
using Table = std::map<std::string, std::vector<ListenerPtr>, std::less<>>;
} // namespace detail


// -----------------------------------------------------------------------------
// Subscription
//
// Handle returned by Registry::add(). unsubscribe() is idempotent and safe to
// call after the registry is gone. Dropping the handle does NOT unsubscribe.
// -----------------------------------------------------------------------------
class Subscription {
public:
    Subscription() = default;

    void unsubscribe();

    // True until unsubscribe() is called (or the registry is destroyed)
    [[nodiscard]]
    bool active() const noexcept;

    [[nodiscard]]
    inline const std::string& topic() const noexcept {
        return topic_;
    }

private:
    friend class Registry;

    Subscription(std::weak_ptr<detail::Table> table, std::string topic, ListenerPtr listener)
        : table_(std::move(table))
        , topic_(std::move(topic))
        , listener_(std::move(listener)) {
    }

    std::weak_ptr<detail::Table> table_;
    std::string topic_;
    ListenerPtr listener_;
};


// Outcome of one dispatch
struct DispatchResult {
    std::size_t delivered{0};   // listeners that returned normally
    std::size_t failed{0};      // listeners that threw
};

/*
===============================================================================
 subscription::Registry
===============================================================================

Topic -> set of listeners.

  - A topic entry exists only while it has at least one listener.
  - dispatch() invokes the listeners of frame.type in registration order
    over a snapshot, so listeners may subscribe or unsubscribe while being
    dispatched to. A listener that throws is logged and counted; delivery
    continues with the next one.

Not thread-safe: used from the Manager's owner thread.
===============================================================================
*/
class Registry {
public:
    Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Registers listener on topic. A listener already present is not added
    // again; the returned handle still removes it.
    [[nodiscard]]
    Subscription add(std::string topic, ListenerPtr listener);

    // Returns false if the listener was not registered on topic
    bool remove(std::string_view topic, const ListenerPtr& listener);

    [[nodiscard]]
    DispatchResult dispatch(const codec::Frame& frame) const;

    [[nodiscard]]
    inline bool empty() const noexcept {
        return table_->empty();
    }

    [[nodiscard]]
    inline std::size_t topic_count() const noexcept {
        return table_->size();
    }

    [[nodiscard]]
    std::size_t listener_count(std::string_view topic) const;

    [[nodiscard]]
    std::vector<std::string> topics() const;

private:
    std::shared_ptr<detail::Table> table_;
};

} // namespace pulselink::core::subscription
