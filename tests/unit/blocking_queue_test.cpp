#include "mpmc/blocking_queue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using thread_pool::BlockingQueue;
using thread_pool::PopResult;

TEST(BlockingQueueTest, TryPushRespectsCapacity) {
    BlockingQueue<int> queue(2);
    EXPECT_TRUE(queue.TryPush(1));
    EXPECT_TRUE(queue.TryPush(2));
    EXPECT_FALSE(queue.TryPush(3));
    EXPECT_EQ(queue.Size(), 2u);
    EXPECT_EQ(queue.Capacity(), 2u);

    auto first = queue.TryPop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 1);
}

// 超时返回 Timeout, 关闭后返回 Closed
TEST(BlockingQueueTest, WaitPopUntilReportsTimeoutAndClose) {
    BlockingQueue<int> queue(4);
    int out = 0;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(queue.WaitPopUntil(out, start + 20ms), PopResult::Timeout);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);

    EXPECT_TRUE(queue.TryPush(5));
    EXPECT_EQ(queue.WaitPopUntil(out, std::chrono::steady_clock::now() + 1s), PopResult::Item);
    EXPECT_EQ(out, 5);

    queue.Close();
    EXPECT_EQ(queue.WaitPopUntil(out, std::chrono::steady_clock::now() + 1s), PopResult::Closed);
}

// 关闭后仍可取出剩余元素, 不再接受新元素
TEST(BlockingQueueTest, CloseDrainsRemainingItems) {
    BlockingQueue<int> queue(4);
    EXPECT_TRUE(queue.TryPush(1));
    queue.Close();
    EXPECT_TRUE(queue.Closed());
    EXPECT_FALSE(queue.TryPush(2));

    auto item = queue.WaitPop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, 1);
    EXPECT_FALSE(queue.WaitPop().has_value());
}

// 关闭会唤醒阻塞在满队列上的生产者
TEST(BlockingQueueTest, CloseWakesBlockedProducer) {
    BlockingQueue<int> queue(1);
    ASSERT_TRUE(queue.TryPush(1));
    bool pushed = true;
    std::thread producer([&] { pushed = queue.WaitPush(2); });
    std::this_thread::sleep_for(20ms);
    queue.Close();
    producer.join();
    EXPECT_FALSE(pushed);
}

TEST(BlockingQueueTest, MultipleProducersSingleConsumer) {
    BlockingQueue<int> queue(8);
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&queue] {
            for (int i = 0; i < 100; ++i) {
                ASSERT_TRUE(queue.WaitPush(1));
            }
        });
    }
    int sum = 0;
    for (int i = 0; i < 400; ++i) {
        auto item = queue.WaitPop();
        ASSERT_TRUE(item.has_value());
        sum += *item;
    }
    for (auto& producer : producers) {
        producer.join();
    }
    EXPECT_EQ(sum, 400);
    EXPECT_EQ(queue.Size(), 0u);
}

TEST(BlockingQueueTest, ClearReturnsQueuedItems) {
    BlockingQueue<int> queue(4);
    EXPECT_TRUE(queue.TryPush(1));
    EXPECT_TRUE(queue.TryPush(2));
    auto dropped = queue.Clear();
    EXPECT_EQ(dropped.size(), 2u);
    EXPECT_EQ(queue.Size(), 0u);
}
