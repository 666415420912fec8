#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace chatpace {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe. Handlers run on the publishing thread,
// which for delivery events is the session's worker thread.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Handlers called in registration order, mutex released first, so a
    // handler may publish or (un)subscribe itself.
    void publish(const Event& event);

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Drops its subscriptions when destroyed.
class SubscriptionSet {
public:
    explicit SubscriptionSet(EventBus* bus = nullptr) : bus_(bus) {}
    ~SubscriptionSet() { reset(); }

    SubscriptionSet(const SubscriptionSet&) = delete;
    SubscriptionSet& operator=(const SubscriptionSet&) = delete;

    void bind(EventBus* bus);
    void add(uint64_t id) { ids_.push_back(id); }
    void reset();

    bool empty() const { return ids_.empty(); }

private:
    EventBus* bus_;
    std::vector<uint64_t> ids_;
};

} // namespace chatpace
