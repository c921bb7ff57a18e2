#include <gtest/gtest.h>
#include "syncwatch/events/event_bus.hpp"
#include "syncwatch/events/events.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace syncwatch::events;
using syncwatch::ClientError;
using syncwatch::ErrorKind;

namespace {

SnapshotReceivedEvent make_snapshot_event(std::uint64_t files_processed) {
    SnapshotReceivedEvent event;
    event.snapshot.source_id = "src-1";
    event.snapshot.files_processed = files_processed;
    return event;
}

} // namespace

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::uint64_t received = 0;

    bus.subscribe<SnapshotReceivedEvent>([&](const SnapshotReceivedEvent& e) {
        handler_called = true;
        received = e.snapshot.files_processed;
    });

    bus.emit(make_snapshot_event(42));

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received, 42u);
}

TEST(EventBus, HandlersRunInSubscriptionOrder) {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe<SnapshotReceivedEvent>([&](const SnapshotReceivedEvent&) { order.push_back(1); });
    bus.subscribe<SnapshotReceivedEvent>([&](const SnapshotReceivedEvent&) { order.push_back(2); });
    bus.subscribe<SnapshotReceivedEvent>([&](const SnapshotReceivedEvent&) { order.push_back(3); });

    bus.emit(make_snapshot_event(1));

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int snapshot_count = 0;
    int error_count = 0;

    bus.subscribe<SnapshotReceivedEvent>([&](const SnapshotReceivedEvent&) { snapshot_count++; });
    bus.subscribe<ClientErrorEvent>([&](const ClientErrorEvent&) { error_count++; });

    bus.emit(make_snapshot_event(1));
    bus.emit(ClientErrorEvent{"src-1", ClientError(ErrorKind::Decode, "bad frame")});
    bus.emit(make_snapshot_event(2));

    EXPECT_EQ(snapshot_count, 2);
    EXPECT_EQ(error_count, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<SnapshotReceivedEvent>([&](const SnapshotReceivedEvent&) { count++; });

    bus.emit(make_snapshot_event(1));
    EXPECT_EQ(count, 1);

    EXPECT_TRUE(bus.unsubscribe<SnapshotReceivedEvent>(id));
    EXPECT_FALSE(bus.unsubscribe<SnapshotReceivedEvent>(id));

    bus.emit(make_snapshot_event(2));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;

    EXPECT_NO_THROW(bus.emit(make_snapshot_event(1)));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int reached = 0;

    bus.subscribe<SnapshotReceivedEvent>([&](const SnapshotReceivedEvent&) { reached++; });
    bus.subscribe<SnapshotReceivedEvent>([](const SnapshotReceivedEvent&) {
        throw std::runtime_error("subscriber bug");
    });
    bus.subscribe<SnapshotReceivedEvent>([&](const SnapshotReceivedEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(make_snapshot_event(1)));
    EXPECT_EQ(reached, 2);
}

TEST(EventBus, HandlerMaySubscribeDuringEmit) {
    EventBus bus;
    int late_calls = 0;

    bus.subscribe<SnapshotReceivedEvent>([&](const SnapshotReceivedEvent&) {
        bus.subscribe<SnapshotReceivedEvent>([&](const SnapshotReceivedEvent&) { late_calls++; });
    });

    bus.emit(make_snapshot_event(1));
    EXPECT_EQ(late_calls, 0);  // No replay for the handler added mid-emit

    bus.emit(make_snapshot_event(2));
    EXPECT_EQ(late_calls, 1);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    bus.subscribe<SnapshotReceivedEvent>([&count](const SnapshotReceivedEvent& e) {
        count += static_cast<int>(e.snapshot.files_processed);
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(make_snapshot_event(1));
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 50);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<SnapshotReceivedEvent>(), 0u);

    auto id1 = bus.subscribe<SnapshotReceivedEvent>([](const SnapshotReceivedEvent&) {});
    bus.subscribe<SnapshotReceivedEvent>([](const SnapshotReceivedEvent&) {});
    bus.subscribe<HeartbeatReceivedEvent>([](const HeartbeatReceivedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<SnapshotReceivedEvent>(), 2u);

    bus.unsubscribe<SnapshotReceivedEvent>(id1);
    EXPECT_EQ(bus.subscriber_count<SnapshotReceivedEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<SnapshotReceivedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<HeartbeatReceivedEvent>(), 0u);
}
