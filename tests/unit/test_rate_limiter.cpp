#include <gtest/gtest.h>
#include "mediaharvest/transfer/rate_limiter.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>
#include <vector>

using namespace mediaharvest::transfer;

class RateLimiterTest : public ::testing::Test {};

TEST_F(RateLimiterTest, StartsFull) {
    RateLimiter limiter(5.0);
    EXPECT_DOUBLE_EQ(limiter.capacity(), 5.0);
    
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(limiter.try_acquire()) << "token " << i;
    }
    EXPECT_FALSE(limiter.try_acquire());
}

TEST_F(RateLimiterTest, CapacityDefaultsToAtLeastOne) {
    RateLimiter slow(0.5);
    EXPECT_DOUBLE_EQ(slow.capacity(), 1.0);
    EXPECT_TRUE(slow.try_acquire());
    EXPECT_FALSE(slow.try_acquire());
    
    RateLimiter explicit_capacity(2.0, 10.0);
    EXPECT_DOUBLE_EQ(explicit_capacity.capacity(), 10.0);
}

TEST_F(RateLimiterTest, Refills) {
    RateLimiter limiter(100.0, 1.0);
    ASSERT_TRUE(limiter.try_acquire());
    EXPECT_FALSE(limiter.try_acquire());
    
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_TRUE(limiter.try_acquire());
}

TEST_F(RateLimiterTest, NeverExceedsCapacity) {
    RateLimiter limiter(1000.0, 3.0);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_LE(limiter.available_tokens(), 3.0);
}

TEST_F(RateLimiterTest, UnlimitedNeverBlocks) {
    RateLimiter limiter(0.0);
    EXPECT_TRUE(limiter.unlimited());
    
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 10000; ++i) {
        limiter.acquire();
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::seconds(1));
}

TEST_F(RateLimiterTest, ConcurrentAcquiresRespectBound) {
    const double rate = 20.0;
    auto start = std::chrono::steady_clock::now();
    RateLimiter limiter(rate);
    
    std::atomic<int> acquired{0};
    std::atomic<bool> stop{false};
    std::vector<std::thread> threads;
    
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            while (!stop.load()) {
                if (limiter.try_acquire()) {
                    acquired++;
                } else {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
            }
        });
    }
    
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    stop = true;
    for (auto& thread : threads) {
        thread.join();
    }
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    
    // capacity + rate * elapsed
    EXPECT_LE(acquired.load(), static_cast<int>(std::floor(limiter.capacity() + rate * elapsed)));
    EXPECT_GE(acquired.load(), static_cast<int>(limiter.capacity()));
}

TEST_F(RateLimiterTest, AcquireBlocksUntilTokenArrives) {
    RateLimiter limiter(10.0, 1.0);
    limiter.acquire();
    
    auto start = std::chrono::steady_clock::now();
    limiter.acquire();
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    
    EXPECT_GE(waited.count(), 80);
}

TEST_F(RateLimiterTest, OversizedRequestTakesFullBucket) {
    RateLimiter limiter(20.0, 2.0);
    EXPECT_FALSE(limiter.try_acquire(5.0));
    
    auto start = std::chrono::steady_clock::now();
    limiter.acquire(5.0);
    auto elapsed = std::chrono::steady_clock::now() - start;
    
    EXPECT_LT(elapsed, std::chrono::seconds(1));
    EXPECT_LT(limiter.available_tokens(), 1.0);
    
    // The drained bucket needs a refill before the next full request.
    start = std::chrono::steady_clock::now();
    limiter.acquire(5.0);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}
