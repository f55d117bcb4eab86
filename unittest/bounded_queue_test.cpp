// ============================================================================
// BOUNDED BLOCKING QUEUE UNIT TESTS
// ============================================================================
// FIFO order, producer backpressure and close/drain semantics
// ============================================================================

#include <gtest/gtest.h>
#include <operatorstatus/core/queues/bounded_queue.hpp>
#include <atomic>
#include <chrono>
#include <thread>

TEST(BoundedBlockingQueue, FifoOrder) {
    BoundedBlockingQueue<int> queue(4);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_TRUE(queue.push(3));

    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), 3);
}

TEST(BoundedBlockingQueue, ZeroCapacityRejected) {
    EXPECT_THROW(BoundedBlockingQueue<int>(0), std::invalid_argument);
}

TEST(BoundedBlockingQueue, FullQueueBlocksProducer) {
    BoundedBlockingQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        queue.push(2);
        pushed.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());

    EXPECT_EQ(queue.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.pop(), 2);
}

TEST(BoundedBlockingQueue, CloseDrainsRemainingItems) {
    BoundedBlockingQueue<int> queue(3);
    queue.push(7);
    queue.push(8);
    queue.close();

    EXPECT_FALSE(queue.push(9));
    EXPECT_EQ(queue.pop(), 7);
    EXPECT_EQ(queue.pop(), 8);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedBlockingQueue, CloseWakesBlockedConsumer) {
    BoundedBlockingQueue<int> queue(2);
    std::atomic<bool> done{false};

    std::thread consumer([&]() {
        auto item = queue.pop();
        EXPECT_FALSE(item.has_value());
        done.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    consumer.join();
    EXPECT_TRUE(done.load());
}

TEST(BoundedBlockingQueue, TryPushNeverWaits) {
    BoundedBlockingQueue<int> queue(2);
    EXPECT_EQ(queue.capacity(), 2u);

    EXPECT_TRUE(queue.tryPush(1));
    EXPECT_TRUE(queue.tryPush(2));
    EXPECT_FALSE(queue.tryPush(3));
    EXPECT_EQ(queue.size(), 2u);

    EXPECT_EQ(queue.pop(), 1);
    EXPECT_TRUE(queue.tryPush(4));

    queue.close();
    EXPECT_FALSE(queue.tryPush(5));
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), 4);
}
