#include <gtest/gtest.h>
#include "fops/events/event_queue.hpp"
#include <chrono>
#include <string>
#include <thread>

using namespace fops::events;

TEST(ThreadSafeQueue, TryPopInOrder) {
    ThreadSafeQueue<int> queue;

    EXPECT_FALSE(queue.try_pop().has_value());

    queue.push(42);
    queue.push(100);

    auto first = queue.try_pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 42);

    auto second = queue.try_pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), 100);
}

TEST(ThreadSafeQueue, PopForTimesOut) {
    ThreadSafeQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::milliseconds(100));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(val.has_value());
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 90);
}

TEST(ThreadSafeQueue, PopForWakesOnPush) {
    ThreadSafeQueue<std::string> queue;

    std::thread producer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.push("progress");
    });

    auto val = queue.pop_for(std::chrono::seconds(5));
    producer.join();

    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(val.value(), "progress");
}

TEST(ThreadSafeQueue, BoundedQueueDropsOldest) {
    ThreadSafeQueue<int> queue(3);

    for (int i = 1; i <= 5; ++i) {
        queue.push(i);
    }

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.dropped(), 2u);

    auto items = queue.drain();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0], 3);
    EXPECT_EQ(items[2], 5);
    EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueue, ShutdownWakesWaiter) {
    ThreadSafeQueue<int> queue;

    std::thread closer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.shutdown();
    });

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::seconds(5));
    auto elapsed = std::chrono::steady_clock::now() - start;
    closer.join();

    EXPECT_FALSE(val.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}
