#include "relay/events/event_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace relay::events;

TEST(ThreadSafeQueue, PushAndPopInOrder) {
    ThreadSafeQueue<int> queue;

    queue.push(42);
    queue.push(100);

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 42);

    auto second = queue.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), 100);
}

TEST(ThreadSafeQueue, TryPopOnEmpty) {
    ThreadSafeQueue<int> queue;

    EXPECT_FALSE(queue.try_pop().has_value());
    queue.push(123);
    auto value = queue.try_pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 123);
}

TEST(ThreadSafeQueue, PopForTimesOut) {
    ThreadSafeQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto value = queue.pop_for(std::chrono::milliseconds(100));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    EXPECT_FALSE(value.has_value());
    EXPECT_FALSE(queue.is_shutdown());
    EXPECT_GE(elapsed.count(), 90);
}

TEST(ThreadSafeQueue, ShutdownDrainsRemainingItems) {
    ThreadSafeQueue<int> queue;

    queue.push(1);
    queue.shutdown();

    auto value = queue.pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 1);
    EXPECT_FALSE(queue.pop().has_value());
    EXPECT_TRUE(queue.is_shutdown());
}

TEST(ThreadSafeQueue, ProducerConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
        queue.shutdown();
    });

    std::thread consumer([&queue, &sum]() {
        while (auto value = queue.pop()) {
            sum += *value;
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum, 4950);
}
