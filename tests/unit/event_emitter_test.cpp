/**
 * event_emitter_test.cpp - EventEmitter and SubscriberQueue unit tests
 *
 * Tests:
 * 1. Subscription lifecycle (subscribe, emit, pop, unsubscribe, RAII)
 * 2. DROP_OLDEST overflow keeps the newest events
 * 3. BLOCK overflow holds the producer until the consumer catches up
 * 4. Pop timeouts
 * 5. Event filtering (identity and discovery/registry families)
 * 6. Subscriber limit
 * 7. Event ID monotonicity
 * 8. Concurrent emit and unsubscribe
 */

#include "events/event_emitter.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "events/event_types.hpp"

using namespace ascot::events;
using namespace std::chrono_literals;

namespace {

DeviceAppeared create_appeared_event(const std::string &identity = "lamp", uint16_t port = 8080) {
    DeviceAppeared evt;
    evt.identity = identity;
    evt.endpoint.host = "192.168.1.20";
    evt.endpoint.port = port;
    evt.timestamp_ms = 1234567890;
    evt.event_id = 0;  // Will be assigned by emitter
    return evt;
}

HealthChanged create_health_event(const std::string &identity = "lamp") {
    HealthChanged evt;
    evt.identity = identity;
    evt.old_health = "unreachable";
    evt.new_health = "fresh";
    evt.event_id = 0;
    return evt;
}

uint16_t port_of(const Event &event) { return std::get<DeviceAppeared>(event).endpoint.port; }

// Pop without waiting until the queue is empty
std::vector<Event> drain(Subscription &sub) {
    std::vector<Event> events;
    while (auto evt = sub.pop(0)) {
        events.push_back(*evt);
    }
    return events;
}

}  // namespace

// ============================================================================
// Subscription lifecycle
// ============================================================================

TEST(EventEmitterTest, SubscribeAndEmit) {
    EventEmitter emitter(10);

    auto sub = emitter.subscribe();
    ASSERT_NE(sub, nullptr);
    EXPECT_TRUE(sub->is_active());

    emitter.emit(create_appeared_event("lamp", 8081));

    auto received = sub->pop(100);
    ASSERT_TRUE(received.has_value());
    ASSERT_TRUE(std::holds_alternative<DeviceAppeared>(*received));
    auto &appeared = std::get<DeviceAppeared>(*received);
    EXPECT_EQ(appeared.identity, "lamp");
    EXPECT_EQ(appeared.endpoint.port, 8081);
    EXPECT_EQ(appeared.timestamp_ms, 1234567890);
}

TEST(EventEmitterTest, EverySubscriberGetsItsCopy) {
    EventEmitter emitter;
    auto sub1 = emitter.subscribe(EventFilter::all(), 0, "panel");
    auto sub2 = emitter.subscribe(EventFilter::all(), 0, "orchestrator", OverflowPolicy::BLOCK);

    emitter.emit(create_appeared_event("heater", 123));

    auto evt1 = sub1->pop(100);
    auto evt2 = sub2->pop(100);
    ASSERT_TRUE(evt1.has_value());
    ASSERT_TRUE(evt2.has_value());
    EXPECT_EQ(port_of(*evt1), 123);
    EXPECT_EQ(port_of(*evt2), 123);
}

TEST(EventEmitterTest, UnsubscribedQueueReceivesNothing) {
    EventEmitter emitter;
    auto sub1 = emitter.subscribe();
    auto sub2 = emitter.subscribe();

    sub1->unsubscribe();
    EXPECT_FALSE(sub1->is_active());

    emitter.emit(create_appeared_event());

    EXPECT_FALSE(sub1->pop(0).has_value());
    EXPECT_TRUE(sub2->pop(100).has_value());
}

TEST(EventEmitterTest, DestroyedSubscriptionFreesItsSlot) {
    EventEmitter emitter(100, 1);
    {
        auto sub = emitter.subscribe();
        ASSERT_NE(sub, nullptr);
        EXPECT_EQ(emitter.subscribe(), nullptr);
    }
    EXPECT_NE(emitter.subscribe(), nullptr);
}

// ============================================================================
// DROP_OLDEST overflow
// ============================================================================

TEST(EventEmitterTest, DropOldestKeepsNewestEvents) {
    EventEmitter emitter;
    auto sub = emitter.subscribe(EventFilter::all(), 3);

    for (uint16_t port = 1; port <= 4; ++port) {
        emitter.emit(create_appeared_event("d", port));
    }

    auto events = drain(*sub);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(port_of(events[0]), 2);
    EXPECT_EQ(port_of(events[1]), 3);
    EXPECT_EQ(port_of(events[2]), 4);
}

TEST(EventEmitterTest, SlowPanelDoesNotBlockEmit) {
    EventEmitter emitter;
    auto slow_sub = emitter.subscribe(EventFilter::all(), 5, "slow");
    auto fast_sub = emitter.subscribe(EventFilter::all(), 100, "fast");

    for (int i = 0; i < 10; ++i) {
        emitter.emit(create_appeared_event("d", static_cast<uint16_t>(i + 1)));
    }

    auto slow = drain(*slow_sub);
    ASSERT_EQ(slow.size(), 5u);
    EXPECT_EQ(port_of(slow.front()), 6);
    EXPECT_EQ(drain(*fast_sub).size(), 10u);
}

// ============================================================================
// BLOCK overflow
// ============================================================================

TEST(EventEmitterTest, BlockingQueueHoldsProducerUntilConsumed) {
    EventEmitter emitter;
    auto sub = emitter.subscribe(EventFilter::discovery_only(), 2, "orchestrator", OverflowPolicy::BLOCK);

    std::atomic<int> emitted{0};
    std::thread producer([&]() {
        for (uint16_t port = 1; port <= 5; ++port) {
            emitter.emit(create_appeared_event("d", port));
            emitted++;
        }
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(emitted.load(), 2);

    std::vector<uint16_t> ports;
    while (ports.size() < 5) {
        auto evt = sub->pop(1000);
        ASSERT_TRUE(evt.has_value());
        ports.push_back(port_of(*evt));
    }
    producer.join();

    EXPECT_EQ(ports, (std::vector<uint16_t>{1, 2, 3, 4, 5}));
}

TEST(EventEmitterTest, UnsubscribeReleasesBlockedProducer) {
    EventEmitter emitter;
    auto sub = emitter.subscribe(EventFilter::all(), 1, "orchestrator", OverflowPolicy::BLOCK);
    emitter.emit(create_appeared_event());

    std::atomic<bool> returned{false};
    std::thread producer([&]() {
        emitter.emit(create_appeared_event());
        returned = true;
    });

    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(returned.load());

    sub->unsubscribe();
    producer.join();
    EXPECT_TRUE(returned.load());
}

TEST(EventEmitterTest, BlockingSubscriberDoesNotStallOtherFamilies) {
    EventEmitter emitter;
    auto orchestrator = emitter.subscribe(EventFilter::discovery_only(), 1, "orchestrator", OverflowPolicy::BLOCK);
    emitter.emit(create_appeared_event());

    // Registry events never target the full discovery queue
    for (int i = 0; i < 10; ++i) {
        emitter.emit(create_health_event());
    }
    EXPECT_EQ(drain(*orchestrator).size(), 1u);
}

// ============================================================================
// Timeouts
// ============================================================================

TEST(EventEmitterTest, PopBlocksUntilEventAvailable) {
    EventEmitter emitter;
    auto sub = emitter.subscribe();

    std::thread emitter_thread([&emitter]() {
        std::this_thread::sleep_for(50ms);
        emitter.emit(create_appeared_event());
    });

    auto start = std::chrono::steady_clock::now();
    auto event = sub->pop(2000);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(event.has_value());
    EXPECT_GE(elapsed, 40ms);
    EXPECT_LT(elapsed, 1500ms);

    emitter_thread.join();
}

TEST(EventEmitterTest, PopTimesOutIfNoEvent) {
    EventEmitter emitter;
    auto sub = emitter.subscribe();

    auto start = std::chrono::steady_clock::now();
    auto event = sub->pop(50);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(event.has_value());
    EXPECT_GE(elapsed, 40ms);
}

// ============================================================================
// Filtering
// ============================================================================

TEST(EventEmitterTest, FilterByIdentity) {
    EventEmitter emitter;

    EventFilter filter;
    filter.identity = "lamp";
    auto sub = emitter.subscribe(filter);

    emitter.emit(create_appeared_event("lamp"));
    emitter.emit(create_appeared_event("heater"));
    emitter.emit(create_health_event("heater"));

    auto events = drain(*sub);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(get_identity(events[0]), "lamp");
}

TEST(EventEmitterTest, DiscoveryOnlyFilterSkipsRegistryEvents) {
    EventEmitter emitter;
    auto discovery = emitter.subscribe(EventFilter::discovery_only());
    auto registry = emitter.subscribe(EventFilter::registry_only());

    emitter.emit(create_appeared_event());
    emitter.emit(DeviceVanished{0, "lamp", 0});
    emitter.emit(create_health_event());
    emitter.emit(DeviceRemoved{0, "lamp", 0});

    auto discovered = drain(*discovery);
    auto registered = drain(*registry);
    ASSERT_EQ(discovered.size(), 2u);
    ASSERT_EQ(registered.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<DeviceVanished>(discovered[1]));
    EXPECT_TRUE(std::holds_alternative<HealthChanged>(registered[0]));
}

// ============================================================================
// Subscriber limit
// ============================================================================

TEST(EventEmitterTest, MaxSubscriberLimitEnforced) {
    EventEmitter emitter(100, 3);

    auto sub1 = emitter.subscribe();
    auto sub2 = emitter.subscribe();
    auto sub3 = emitter.subscribe();
    EXPECT_EQ(emitter.subscribe(), nullptr);

    sub1->unsubscribe();
    EXPECT_NE(emitter.subscribe(), nullptr);
}

// ============================================================================
// Event IDs
// ============================================================================

TEST(EventEmitterTest, EventIDsAreMonotonic) {
    EventEmitter emitter;
    auto sub = emitter.subscribe();

    for (int i = 0; i < 5; ++i) {
        emitter.emit(create_appeared_event());
    }

    uint64_t prev_id = 0;
    for (const auto &evt : drain(*sub)) {
        uint64_t event_id = get_event_id(evt);
        EXPECT_GT(event_id, prev_id);
        prev_id = event_id;
    }
    EXPECT_EQ(prev_id, 5u);
}

// ============================================================================
// Thread-safety
// ============================================================================

TEST(EventEmitterTest, ConcurrentEmitAndSubscribe) {
    const int num_events = 100;
    const int num_subscribers = 5;

    EventEmitter emitter(100, 50);

    std::atomic<int> total_received{0};
    std::vector<std::thread> threads;
    threads.reserve(num_subscribers + 1);

    threads.emplace_back([&emitter]() {
        for (int i = 0; i < num_events; ++i) {
            emitter.emit(create_appeared_event("d", static_cast<uint16_t>(i + 1)));
            std::this_thread::sleep_for(1ms);
        }
    });

    for (int t = 0; t < num_subscribers; ++t) {
        threads.emplace_back([&emitter, &total_received]() {
            auto sub = emitter.subscribe();
            if (sub) {
                while (auto evt = sub->pop(50)) {
                    total_received++;
                }
            }
        });
    }

    for (auto &th : threads) {
        th.join();
    }

    EXPECT_GT(total_received, 0);
}

TEST(EventEmitterTest, UnsubscribeDuringEmission) {
    EventEmitter emitter(100, 5);

    std::vector<std::unique_ptr<Subscription>> subs;
    subs.reserve(5);
    for (int i = 0; i < 5; ++i) {
        subs.push_back(emitter.subscribe());
    }

    std::thread emitter_thread([&emitter]() {
        for (int i = 0; i < 50; ++i) {
            emitter.emit(create_appeared_event());
            std::this_thread::sleep_for(2ms);
        }
    });

    std::thread unsubscriber_thread([&subs]() {
        std::this_thread::sleep_for(10ms);
        for (auto &sub : subs) {
            sub->unsubscribe();
            std::this_thread::sleep_for(5ms);
        }
    });

    emitter_thread.join();
    unsubscriber_thread.join();

    // All five slots are free again
    std::vector<std::unique_ptr<Subscription>> again;
    for (int i = 0; i < 5; ++i) {
        again.push_back(emitter.subscribe());
        EXPECT_NE(again.back(), nullptr);
    }
}
