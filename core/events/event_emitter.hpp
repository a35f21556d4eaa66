#pragma once

/**
 * @file event_emitter.hpp
 * @brief Fan-out of discovery and registry events to per-subscriber queues
 *
 * The DiscoveryListener and DeviceRegistry emit into one EventEmitter.
 * Each subscriber gets its own bounded queue with an overflow policy:
 * the orchestrator must see every discovery event and holds producers back
 * when it falls behind, while panel subscribers lose their oldest events.
 */

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>

#include "events/event_types.hpp"

namespace ascot {
namespace events {

enum class OverflowPolicy {
    DROP_OLDEST,  // producer never waits; the subscriber loses history
    BLOCK,        // producer waits for space; nothing is lost
};

/**
 * @brief Bounded event queue for a single subscriber
 */
class SubscriberQueue {
public:
    SubscriberQueue(size_t max_size, OverflowPolicy policy, const std::string &name);

    // false when the event was not queued (queue closed) or displaced an older one
    bool push(const Event &event);

    // Wait up to timeout_ms for an event; 0 returns immediately
    std::optional<Event> pop(int timeout_ms);

    // Wakes consumers and any producer waiting for space
    void close();

private:
    const size_t max_size_;
    const OverflowPolicy policy_;
    const std::string name_;

    std::mutex mutex_;
    std::condition_variable ready_cv_;
    std::condition_variable space_cv_;
    std::queue<Event> queue_;
    size_t dropped_ = 0;
    size_t stalls_ = 0;
    bool closed_ = false;
};

/**
 * @brief Subscription handle. Unsubscribes on destruction.
 */
class Subscription {
public:
    using SubscriptionId = uint64_t;

    Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                 std::function<void(SubscriptionId)> unsubscribe_fn);
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    std::optional<Event> pop(int timeout_ms = 100);

    bool is_active() const { return id_ != 0; }
    void unsubscribe();

private:
    SubscriptionId id_;
    std::shared_ptr<SubscriberQueue> queue_;
    std::function<void(SubscriptionId)> unsubscribe_fn_;
};

/**
 * @brief Event filter for subscribers. Default matches everything.
 */
struct EventFilter {
    std::string identity;  // Empty = all devices
    bool discovery = true;
    bool registry = true;

    bool matches(const Event &event) const;

    static EventFilter all();
    static EventFilter discovery_only();
    static EventFilter registry_only();
};

class EventEmitter {
public:
    using SubscriptionId = Subscription::SubscriptionId;

    /**
     * @param default_queue_size Max events per subscriber queue unless overridden
     * @param max_subscribers Concurrent subscriber limit (0 = unlimited)
     */
    explicit EventEmitter(size_t default_queue_size = 100, size_t max_subscribers = 32);

    /**
     * @brief Subscribe to events matching filter
     *
     * @param queue_size Override default queue size (0 = use default)
     * @param name Queue name used in overflow logs
     * @return Subscription handle, or nullptr if max subscribers reached
     */
    std::unique_ptr<Subscription> subscribe(const EventFilter &filter = EventFilter::all(), size_t queue_size = 0,
                                            const std::string &name = "",
                                            OverflowPolicy policy = OverflowPolicy::DROP_OLDEST);

    /**
     * @brief Assign the next event_id and fan out
     *
     * Waits only if a BLOCK subscriber's queue is full. Events from one
     * producer reach each subscriber in emission order.
     */
    void emit(Event event);

private:
    void unsubscribe(SubscriptionId id);

    struct SubscriberInfo {
        std::shared_ptr<SubscriberQueue> queue;
        EventFilter filter;
    };

    const size_t default_queue_size_;
    const size_t max_subscribers_;

    std::mutex mutex_;
    std::unordered_map<SubscriptionId, SubscriberInfo> subscribers_;
    SubscriptionId next_subscription_id_ = 1;
    uint64_t next_event_id_ = 1;
};

}  // namespace events
}  // namespace ascot
