// filename: test_lf_queue.cpp
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "core/lf_queue.hpp"

using namespace std::chrono_literals;

TEST(LfQueue, BasicPutGetLfQ) {
    LfQueue<int> q(4);
    q.put(1);
    auto v = q.get();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, 1);
}

TEST(LfQueue, MultiItemLfQ) {
    LfQueue<int> q(128);
    for (int i = 0; i < 100; ++i) {q.put(i);}
    EXPECT_EQ(q.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        auto v = q.get();
        ASSERT_TRUE(v.has_value());
        EXPECT_EQ(*v, i);
    }
}

TEST(LfQueue, InvalidCapacityLfQ) {
    EXPECT_THROW(LfQueue<int>(0), InvalidCapacity);
    EXPECT_THROW(LfQueue<int>(-1), InvalidCapacity);
}

TEST(LfQueue, LargeCapacityIsOnlyALimitLfQ) {
    // 2^40 slots could never be preallocated; the queue must still be usable
    const std::ptrdiff_t huge = std::ptrdiff_t{1} << 40;
    auto start = std::chrono::steady_clock::now();
    LfQueue<int> q(huge);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(q.capacity(), static_cast<std::size_t>(huge));
    EXPECT_EQ(q.size(), 0u);

    // more items than the initial node reserve
    const int n = static_cast<int>(LfQueue<int>::kNodeReserve) * 3;
    for (int i = 0; i < n; ++i) EXPECT_TRUE(q.try_put(i));
    EXPECT_EQ(q.size(), static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) EXPECT_EQ(*q.get(), i);
}

TEST(LfQueue, CapacityIsHardLfQ) {
    LfQueue<std::string> q(2);
    EXPECT_TRUE(q.try_put("a"));
    EXPECT_TRUE(q.try_put("b"));
    EXPECT_FALSE(q.try_put("c"));
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(*q.get(), "a");
    EXPECT_TRUE(q.try_put("c"));
}

TEST(LfQueue, PutBlocksWhileFullLfQ) {
    LfQueue<int> q(1);
    q.put(1);

    std::atomic<bool> done{false};
    std::thread prod([&] {
        q.put(2);
        done = true;
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(done.load());

    EXPECT_EQ(*q.get(), 1);
    prod.join();
    EXPECT_TRUE(done.load());
    EXPECT_EQ(*q.get(), 2);
}

TEST(LfQueue, CloseAndDrainLfQ) {
    LfQueue<int> q(4);
    q.put(1);
    q.put(2);
    q.close();
    q.close();
    EXPECT_TRUE(q.closed());
    EXPECT_THROW(q.put(3), QueueClosed);

    EXPECT_EQ(*q.get(), 1);
    EXPECT_EQ(*q.get(), 2);
    EXPECT_FALSE(q.get().has_value());

    int out = 0;
    EXPECT_EQ(q.get_for(out, 10ms), PopStatus::Closed);
}

TEST(LfQueue, CloseReleasesBlockedProducerLfQ) {
    LfQueue<int> q(1);
    q.put(1);

    std::atomic<bool> rejected{false};
    std::thread prod([&] {
        try {
            q.put(2);
        } catch (const QueueClosed&) {
            rejected = true;
        }
    });

    std::this_thread::sleep_for(50ms);
    q.close();
    prod.join();
    EXPECT_TRUE(rejected.load());
    EXPECT_EQ(*q.get(), 1);
    EXPECT_FALSE(q.get().has_value());
}

TEST(LfQueue, GetForTimesOutLfQ) {
    LfQueue<int> q(1);
    int out = -1;
    EXPECT_EQ(q.get_for(out, 20ms), PopStatus::Timeout);
    q.put(5);
    EXPECT_EQ(q.get_for(out, 20ms), PopStatus::Item);
    EXPECT_EQ(out, 5);
}

TEST(LfQueue, ThreadsLfQ) {
    constexpr int N = 100000;
    LfQueue<int> q(64);
    std::vector<int> results;
    results.reserve(N);

    std::thread prod([&] {
        for (int i = 0; i < N; ++i) {
            q.put(i);
        }
        q.close();
    });

    std::thread cons([&] {
        while (auto v = q.get()) {
            results.push_back(*v);
        }
    });

    prod.join();
    cons.join();

    ASSERT_EQ(results.size(), static_cast<std::size_t>(N));
    for (int i = 0; i < N; ++i) {
        EXPECT_EQ(results[i], i);
    }
}
