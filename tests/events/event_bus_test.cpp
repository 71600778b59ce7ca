#include "lsync/events/event_bus.hpp"
#include "lsync/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using lsync::events::ConnectivityChangedEvent;
using lsync::events::DownloadProgressEvent;
using lsync::events::EntityChangedEvent;
using lsync::events::EventBus;

TEST(EventBus, DeliversToSubscriberOfThatType) {
    EventBus bus;

    std::vector<std::string> seen;
    bus.subscribe<EntityChangedEvent>([&](const EntityChangedEvent& e) { seen.push_back(e.collection + "/" + e.id); });

    bus.emit(EntityChangedEvent{"progress", "lesson1", "local", false});

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "progress/lesson1");
}

TEST(EventBus, EverySubscriberSeesTheEvent) {
    EventBus bus;

    int ui = 0;
    int metrics = 0;
    bus.subscribe<ConnectivityChangedEvent>([&](const ConnectivityChangedEvent&) { ui++; });
    bus.subscribe<ConnectivityChangedEvent>([&](const ConnectivityChangedEvent&) { metrics++; });

    bus.emit(ConnectivityChangedEvent{true});
    bus.emit(ConnectivityChangedEvent{false});

    EXPECT_EQ(ui, 2);
    EXPECT_EQ(metrics, 2);
}

TEST(EventBus, TypesAreRoutedIndependently) {
    EventBus bus;

    int entity_events = 0;
    std::uint64_t bytes = 0;
    bus.subscribe<EntityChangedEvent>([&](const EntityChangedEvent&) { entity_events++; });
    bus.subscribe<DownloadProgressEvent>([&](const DownloadProgressEvent& e) { bytes = e.transferred_bytes; });

    bus.emit(DownloadProgressEvent{"dl-1", "lessons/l1", 4096, 8192});
    bus.emit(EntityChangedEvent{"lessons", "l1", "download", false});

    EXPECT_EQ(entity_events, 1);
    EXPECT_EQ(bytes, 4096u);
}

TEST(EventBus, TypedUnsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<ConnectivityChangedEvent>([&](const ConnectivityChangedEvent&) { count++; });
    bus.emit(ConnectivityChangedEvent{true});

    bus.unsubscribe<ConnectivityChangedEvent>(id);
    bus.emit(ConnectivityChangedEvent{false});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<ConnectivityChangedEvent>(), 0u);
}

TEST(EventBus, UntypedUnsubscribeFindsTheHandler) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<EntityChangedEvent>([&](const EntityChangedEvent&) { count++; });
    bus.subscribe<ConnectivityChangedEvent>([&](const ConnectivityChangedEvent&) { count++; });

    bus.unsubscribe(id);

    bus.emit(EntityChangedEvent{"courses", "c1", "pull", false});
    bus.emit(ConnectivityChangedEvent{true});
    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<ConnectivityChangedEvent>(), 1u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int count = 0;
    bus.subscribe<EntityChangedEvent>([](const EntityChangedEvent&) { throw std::runtime_error("ui gone"); });
    bus.subscribe<EntityChangedEvent>([&](const EntityChangedEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(EntityChangedEvent{"courses", "c1", "pull", false}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, HandlerMayEmitAndSubscribe) {
    EventBus bus;

    bool offline_seen = false;
    bus.subscribe<EntityChangedEvent>([&](const EntityChangedEvent& e) {
        if (e.deleted) {
            bus.subscribe<ConnectivityChangedEvent>(
                [&](const ConnectivityChangedEvent& c) { offline_seen = !c.online; });
            bus.emit(ConnectivityChangedEvent{false});
        }
    });

    bus.emit(EntityChangedEvent{"courses", "c1", "pull", true});
    EXPECT_TRUE(offline_seen);
}

TEST(EventBus, EmitWithoutSubscribersIsNoop) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(DownloadProgressEvent{"dl-1", "lessons/l1", 0, 0}));
}

TEST(EventBus, ConcurrentSubscribeAndEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> total{0};

    std::vector<std::thread> subscribers;
    for (int i = 0; i < 8; ++i) {
        subscribers.emplace_back([&]() {
            bus.subscribe<DownloadProgressEvent>([&total](const DownloadProgressEvent& e) {
                total += e.transferred_bytes;
            });
        });
    }
    for (auto& t : subscribers) {
        t.join();
    }

    std::vector<std::thread> emitters;
    for (int i = 0; i < 50; ++i) {
        emitters.emplace_back([&bus]() { bus.emit(DownloadProgressEvent{"dl-1", "lessons/l1", 2, 100}); });
    }
    for (auto& t : emitters) {
        t.join();
    }

    EXPECT_EQ(total.load(), 8u * 50u * 2u);
}

TEST(EventBus, ClearDropsEverything) {
    EventBus bus;

    bus.subscribe<EntityChangedEvent>([](const EntityChangedEvent&) {});
    bus.subscribe<EntityChangedEvent>([](const EntityChangedEvent&) {});
    bus.subscribe<ConnectivityChangedEvent>([](const ConnectivityChangedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<EntityChangedEvent>(), 2u);

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<EntityChangedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ConnectivityChangedEvent>(), 0u);
}
