#include <gtest/gtest.h>
#include "lockfreequeue/array_mpmc_queue.hpp"
#include "lockfreequeue/blocking_queue.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Queue = lf::BlockingQueue<lf::ArrayMPMCQueue<int>>;

TEST(ArrayMPMCQueue, CapacityRoundsUpToPowerOfTwo) {
    lf::ArrayMPMCQueue<int> q(5);
    EXPECT_EQ(q.capacity(), 8u);
    for (int i = 0; i < 8; ++i) EXPECT_TRUE(q.try_push(i));
    EXPECT_FALSE(q.try_push(8));
    EXPECT_EQ(q.clear(), 8u);
    EXPECT_TRUE(q.empty());
}

TEST(BlockingQueue, LimitIsExactEvenWhenRingIsLarger) {
    Queue q(3);
    EXPECT_EQ(q.limit(), 3u);
    EXPECT_EQ(q.push(1), lf::QueueStatus::OK);
    EXPECT_EQ(q.push(2), lf::QueueStatus::OK);
    EXPECT_EQ(q.push(3), lf::QueueStatus::OK);
    EXPECT_EQ(q.push_for(4, 20ms), lf::QueueStatus::TIMEOUT);
    EXPECT_EQ(q.size(), 3u);

    int v = 0;
    EXPECT_EQ(q.pop(v), lf::QueueStatus::OK);
    EXPECT_EQ(v, 1);
    EXPECT_EQ(q.push_for(4, 20ms), lf::QueueStatus::OK);
}

TEST(BlockingQueue, PopTimesOutWhenEmpty) {
    Queue q(2);
    int v = 0;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(q.pop_for(v, 30ms), lf::QueueStatus::TIMEOUT);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(BlockingQueue, CloseDrainsThenReportsClosed) {
    Queue q(4);
    q.push(7);
    q.push(8);
    q.close();
    EXPECT_EQ(q.push(9), lf::QueueStatus::CLOSED);

    int v = 0;
    EXPECT_EQ(q.pop(v), lf::QueueStatus::OK);
    EXPECT_EQ(v, 7);
    EXPECT_EQ(q.pop(v), lf::QueueStatus::OK);
    EXPECT_EQ(v, 8);
    EXPECT_EQ(q.pop(v), lf::QueueStatus::CLOSED);
    EXPECT_EQ(q.pop(v), lf::QueueStatus::CLOSED);
}

TEST(BlockingQueue, AbortWakesBlockedProducer) {
    Queue q(1);
    q.push(1);
    std::atomic<int> result{-1};
    std::thread producer([&] {
        result = static_cast<int>(q.push(2));
    });
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(result.load(), -1);
    EXPECT_TRUE(q.abort());
    producer.join();
    EXPECT_EQ(result.load(), static_cast<int>(lf::QueueStatus::ABORTED));
    EXPECT_FALSE(q.abort());
    EXPECT_EQ(q.size(), 0u);
}

TEST(BlockingQueue, AbortWakesBlockedConsumerAndDropsItems) {
    Queue q(4);
    std::atomic<int> result{-1};
    std::thread consumer([&] {
        int v;
        result = static_cast<int>(q.pop(v));
    });
    std::this_thread::sleep_for(20ms);
    q.abort();
    consumer.join();
    EXPECT_EQ(result.load(), static_cast<int>(lf::QueueStatus::ABORTED));

    int v;
    EXPECT_EQ(q.pop(v), lf::QueueStatus::ABORTED);
    EXPECT_EQ(q.push(3), lf::QueueStatus::ABORTED);
}

TEST(BlockingQueue, AbortAfterCloseStillBreaks) {
    Queue q(4);
    q.push(1);
    q.close();
    q.abort();
    int v;
    EXPECT_EQ(q.pop(v), lf::QueueStatus::ABORTED);
}

TEST(BlockingQueue, ProducerConsumerKeepsOrder) {
    Queue q(4);
    constexpr int count = 10000;
    std::thread producer([&] {
        for (int i = 0; i < count; ++i) {
            ASSERT_EQ(q.push(i), lf::QueueStatus::OK);
        }
        q.close();
    });

    std::vector<int> seen;
    int v;
    while (q.pop(v) == lf::QueueStatus::OK) {
        seen.push_back(v);
        EXPECT_LE(q.size(), 4u);
    }
    producer.join();

    ASSERT_EQ(seen.size(), static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) EXPECT_EQ(seen[i], i);
}

TEST(BlockingQueue, MultiProducerConsumer) {
    Queue q(64);
    constexpr int producers = 4;
    constexpr int consumers = 4;
    constexpr int per_prod = 5000;

    std::atomic<long> sum_push{0};
    std::atomic<long> sum_pop{0};
    std::atomic<int> producers_left{producers};

    std::vector<std::thread> ths;
    for (int p = 0; p < producers; ++p) {
        ths.emplace_back([&] {
            for (int i = 1; i <= per_prod; ++i) {
                q.push(i);
                sum_push.fetch_add(i, std::memory_order_relaxed);
            }
            if (producers_left.fetch_sub(1) == 1) q.close();
        });
    }
    for (int c = 0; c < consumers; ++c) {
        ths.emplace_back([&] {
            int value;
            while (q.pop(value) == lf::QueueStatus::OK) {
                sum_pop.fetch_add(value, std::memory_order_relaxed);
            }
        });
    }
    for (auto& t : ths) t.join();
    EXPECT_EQ(sum_push.load(), sum_pop.load());
}
