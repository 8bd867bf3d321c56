// =============================================================================
// statlog - Bounded Queue Tests
// =============================================================================

#include "statlog/pipeline/bounded_queue.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace statlog::pipeline::test {

TEST(BoundedQueueTest, KeepsFifoOrder) {
    BoundedQueue<int> queue(4);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_TRUE(queue.push(3));

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), 3);
}

TEST(BoundedQueueTest, ZeroCapacityBecomesOne) {
    BoundedQueue<int> queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
}

TEST(BoundedQueueTest, CloseDrainsRemainingItems) {
    BoundedQueue<std::string> queue(4);
    ASSERT_TRUE(queue.push("a"));
    ASSERT_TRUE(queue.push("b"));
    queue.close();

    EXPECT_FALSE(queue.push("c"));
    EXPECT_EQ(queue.pop(), "a");
    EXPECT_EQ(queue.pop(), "b");
    EXPECT_EQ(queue.pop(), std::nullopt);
}

TEST(BoundedQueueTest, CancelDiscardsItems) {
    BoundedQueue<int> queue(4);
    ASSERT_TRUE(queue.push(1));
    queue.cancel();

    EXPECT_TRUE(queue.isCancelled());
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_EQ(queue.pop(), std::nullopt);
    EXPECT_FALSE(queue.push(2));
}

TEST(BoundedQueueTest, PushBlocksWhileFull) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    std::jthread producer([&] {
        EXPECT_TRUE(queue.push(2));
        pushed.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());

    EXPECT_EQ(queue.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.pop(), 2);
}

TEST(BoundedQueueTest, CancelWakesBlockedProducerAndConsumer) {
    BoundedQueue<int> full(1);
    ASSERT_TRUE(full.push(1));
    BoundedQueue<int> empty(1);

    std::atomic<bool> pushResult{true};
    std::atomic<bool> popEmpty{false};
    {
        std::jthread producer([&] { pushResult.store(full.push(2)); });
        std::jthread consumer([&] { popEmpty.store(!empty.pop().has_value()); });

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        full.cancel();
        empty.cancel();
    }

    EXPECT_FALSE(pushResult.load());
    EXPECT_TRUE(popEmpty.load());
}

TEST(BoundedQueueTest, ProducerConsumerPreservesOrder) {
    constexpr int kItems = 10'000;
    BoundedQueue<int> queue(16);
    std::vector<int> received;
    received.reserve(kItems);

    {
        std::jthread consumer([&] {
            while (auto item = queue.pop()) {
                received.push_back(*item);
            }
        });
        for (int i = 0; i < kItems; ++i) {
            EXPECT_TRUE(queue.push(i));
        }
        queue.close();
    }

    ASSERT_EQ(received.size(), static_cast<std::size_t>(kItems));
    for (int i = 0; i < kItems; ++i) {
        EXPECT_EQ(received[static_cast<std::size_t>(i)], i);
    }
}

}  // namespace statlog::pipeline::test
