#include <gtest/gtest.h>
#include "fops/events/event_bus.hpp"
#include "fops/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace fops::events;
using fops::ops::OperationKind;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    std::string received_id;
    std::uint64_t received_items = 0;

    bus.subscribe<OperationCompletedEvent>([&](const OperationCompletedEvent& e) {
        received_id = e.operation_id;
        received_items = e.items_processed;
    });

    bus.emit(OperationCompletedEvent{"op-1", OperationKind::Copy, 3, 30, 0, {}});

    EXPECT_EQ(received_id, "op-1");
    EXPECT_EQ(received_items, 3u);
}

TEST(EventBus, DeliversOnlyToMatchingType) {
    EventBus bus;

    int completed = 0;
    int cancelled = 0;

    bus.subscribe<OperationCompletedEvent>([&](const OperationCompletedEvent&) { completed++; });
    bus.subscribe<OperationCancelledEvent>([&](const OperationCancelledEvent&) { cancelled++; });

    bus.emit(OperationCompletedEvent{"op-1", OperationKind::Copy, 1, 1, 0, {}});
    bus.emit(OperationCancelledEvent{"op-2", OperationKind::Move, 0, true});
    bus.emit(OperationCompletedEvent{"op-3", OperationKind::Delete, 1, 1, 0, {}});

    EXPECT_EQ(completed, 2);
    EXPECT_EQ(cancelled, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<OperationFailedEvent>([&](const OperationFailedEvent&) { count++; });

    bus.emit(OperationFailedEvent{"op-1", OperationKind::Copy, fops::Error::cancelled()});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<OperationFailedEvent>(id);

    bus.emit(OperationFailedEvent{"op-1", OperationKind::Copy, fops::Error::cancelled()});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int delivered = 0;
    bus.subscribe<OperationProgressEvent>([](const OperationProgressEvent&) {
        throw std::runtime_error("host widget went away");
    });
    bus.subscribe<OperationProgressEvent>([&](const OperationProgressEvent&) { delivered++; });

    EXPECT_NO_THROW(bus.emit(OperationProgressEvent{"op-1", OperationKind::Copy, {}}));
    EXPECT_EQ(delivered, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(OperationStartedEvent{"op-1", OperationKind::Copy, {"/a"}, "/b"}));
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    bus.subscribe<OperationProgressEvent>([&count](const OperationProgressEvent& e) {
        count += static_cast<int>(e.progress.items_done);
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() {
            fops::ops::ProgressSnapshot snapshot;
            snapshot.items_done = 2;
            bus.emit(OperationProgressEvent{"op-1", OperationKind::Copy, snapshot});
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 100);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<ConflictDetectedEvent>(), 0u);
    auto id = bus.subscribe<ConflictDetectedEvent>([](const ConflictDetectedEvent&) {});
    bus.subscribe<ConflictDetectedEvent>([](const ConflictDetectedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<ConflictDetectedEvent>(), 2u);

    bus.unsubscribe<ConflictDetectedEvent>(id);
    EXPECT_EQ(bus.subscriber_count<ConflictDetectedEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<ConflictDetectedEvent>(), 0u);
}
