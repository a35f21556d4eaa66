#include "events/event_emitter.hpp"

#include <chrono>
#include <utility>
#include <vector>

#include "logging/logger.hpp"

namespace ascot {
namespace events {

SubscriberQueue::SubscriberQueue(size_t max_size, OverflowPolicy policy, const std::string &name)
    : max_size_(max_size), policy_(policy), name_(name) {}

bool SubscriberQueue::push(const Event &event) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }

    bool displaced = false;
    size_t dropped = 0;
    if (queue_.size() >= max_size_) {
        if (policy_ == OverflowPolicy::BLOCK) {
            size_t stalls = ++stalls_;
            lock.unlock();
            if (stalls % 100 == 1) {
                LOG_WARN("[EventEmitter] Queue '" << name_ << "' full, producer waiting (" << stalls
                                                  << " stalls total)");
            }
            lock.lock();
            space_cv_.wait(lock, [this] { return queue_.size() < max_size_ || closed_; });
            if (closed_) {
                return false;
            }
        } else {
            queue_.pop();
            displaced = true;
            dropped = ++dropped_;
        }
    }

    queue_.push(event);
    lock.unlock();
    ready_cv_.notify_one();

    if (displaced && dropped % 100 == 1) {
        LOG_WARN("[EventEmitter] Queue '" << name_ << "' overflow, dropped " << dropped << " events total");
    }
    return !displaced;
}

std::optional<Event> SubscriberQueue::pop(int timeout_ms) {
    std::optional<Event> event;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (timeout_ms > 0) {
            ready_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                               [this] { return !queue_.empty() || closed_; });
        }
        if (queue_.empty()) {
            return std::nullopt;
        }
        event = std::move(queue_.front());
        queue_.pop();
    }
    space_cv_.notify_one();
    return event;
}

void SubscriberQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    ready_cv_.notify_all();
    space_cv_.notify_all();
}

Subscription::Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                           std::function<void(SubscriptionId)> unsubscribe_fn)
    : id_(id), queue_(std::move(queue)), unsubscribe_fn_(std::move(unsubscribe_fn)) {}

Subscription::~Subscription() { unsubscribe(); }

std::optional<Event> Subscription::pop(int timeout_ms) {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->pop(timeout_ms);
}

void Subscription::unsubscribe() {
    if (id_ == 0) {
        return;
    }
    if (unsubscribe_fn_) {
        unsubscribe_fn_(id_);
    }
    id_ = 0;
    if (queue_) {
        queue_->close();
    }
}

bool EventFilter::matches(const Event &event) const {
    const bool from_discovery = is_discovery_event(event);
    if (from_discovery && !discovery) {
        return false;
    }
    if (!from_discovery && !registry) {
        return false;
    }
    return identity.empty() || get_identity(event) == identity;
}

EventFilter EventFilter::all() { return EventFilter{}; }

EventFilter EventFilter::discovery_only() {
    EventFilter filter;
    filter.registry = false;
    return filter;
}

EventFilter EventFilter::registry_only() {
    EventFilter filter;
    filter.discovery = false;
    return filter;
}

EventEmitter::EventEmitter(size_t default_queue_size, size_t max_subscribers)
    : default_queue_size_(default_queue_size), max_subscribers_(max_subscribers) {}

std::unique_ptr<Subscription> EventEmitter::subscribe(const EventFilter &filter, size_t queue_size,
                                                      const std::string &name, OverflowPolicy policy) {
    SubscriptionId id = 0;
    std::shared_ptr<SubscriberQueue> queue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (max_subscribers_ > 0 && subscribers_.size() >= max_subscribers_) {
            LOG_WARN("[EventEmitter] Max subscribers (" << max_subscribers_ << ") reached, rejecting '" << name
                                                        << "'");
            return nullptr;
        }
        id = next_subscription_id_++;
        queue = std::make_shared<SubscriberQueue>(queue_size > 0 ? queue_size : default_queue_size_, policy, name);
        subscribers_[id] = SubscriberInfo{queue, filter};
    }

    LOG_DEBUG("[EventEmitter] Subscription " << id << (name.empty() ? "" : " (" + name + ")") << " created");
    return std::make_unique<Subscription>(id, std::move(queue),
                                          [this](SubscriptionId sub_id) { this->unsubscribe(sub_id); });
}

void EventEmitter::emit(Event event) {
    std::vector<std::shared_ptr<SubscriberQueue>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t id = next_event_id_++;
        std::visit([id](auto &&e) { e.event_id = id; }, event);

        for (const auto &[sub_id, info] : subscribers_) {
            static_cast<void>(sub_id);
            if (info.filter.matches(event)) {
                targets.push_back(info.queue);
            }
        }
    }

    // Outside the lock: a BLOCK queue may wait for its consumer
    for (auto &queue : targets) {
        queue->push(event);
    }
}

void EventEmitter::unsubscribe(SubscriptionId id) {
    std::shared_ptr<SubscriberQueue> queue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) {
            return;
        }
        queue = std::move(it->second.queue);
        subscribers_.erase(it);
    }
    queue->close();
    LOG_DEBUG("[EventEmitter] Subscription " << id << " removed");
}

}  // namespace events
}  // namespace ascot
