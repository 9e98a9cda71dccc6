/**
 * @file test_concurrency_limiter.cpp
 * @brief Unit tests for the transfer admission gate
 */

#include <gtest/gtest.h>

#include <cloudxfer/core/concurrency_limiter.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <random>
#include <thread>
#include <vector>

namespace cloudxfer::test {

class ConcurrencyLimiterTest : public ::testing::Test {
protected:
    template <typename Predicate>
    static bool wait_until(Predicate pred,
                           std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return pred();
    }
};

// Construction tests

TEST_F(ConcurrencyLimiterTest, DefaultCapacityIsOne) {
    concurrency_limiter limiter;
    EXPECT_EQ(limiter.max(), 1u);
    EXPECT_EQ(limiter.active(), 0u);
}

TEST_F(ConcurrencyLimiterTest, ZeroCapacityClampedToOne) {
    concurrency_limiter limiter(0);
    EXPECT_EQ(limiter.max(), 1u);

    limiter.set_max(0);
    EXPECT_EQ(limiter.max(), 1u);
}

// Acquire / release tests

TEST_F(ConcurrencyLimiterTest, TryAcquireRespectsCapacity) {
    concurrency_limiter limiter(2);

    EXPECT_TRUE(limiter.try_acquire());
    EXPECT_TRUE(limiter.try_acquire());
    EXPECT_FALSE(limiter.try_acquire());
    EXPECT_EQ(limiter.active(), 2u);

    limiter.release();
    EXPECT_EQ(limiter.active(), 1u);
    EXPECT_TRUE(limiter.try_acquire());
}

TEST_F(ConcurrencyLimiterTest, ReleaseWithoutAcquireIsHarmless) {
    concurrency_limiter limiter(1);
    limiter.release();
    EXPECT_EQ(limiter.active(), 0u);
}

TEST_F(ConcurrencyLimiterTest, AcquireBlocksUntilRelease) {
    concurrency_limiter limiter(1);
    limiter.acquire();

    std::atomic<bool> admitted{false};
    std::thread waiter([&] {
        limiter.acquire();
        admitted = true;
        limiter.release();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(admitted.load());

    limiter.release();
    waiter.join();
    EXPECT_TRUE(admitted.load());
    EXPECT_EQ(limiter.active(), 0u);
}

TEST_F(ConcurrencyLimiterTest, ScopedSlotReleasesOnExit) {
    concurrency_limiter limiter(1);
    {
        scoped_slot slot(limiter);
        EXPECT_EQ(limiter.active(), 1u);
    }
    EXPECT_EQ(limiter.active(), 0u);
}

// Reconfiguration tests

TEST_F(ConcurrencyLimiterTest, RaisingMaxWakesWaiters) {
    concurrency_limiter limiter(1);
    limiter.acquire();

    std::atomic<int> admitted{0};
    std::vector<std::thread> waiters;
    for (int i = 0; i < 3; ++i) {
        waiters.emplace_back([&] {
            limiter.acquire();
            ++admitted;
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(admitted.load(), 0);

    limiter.set_max(4);
    EXPECT_TRUE(wait_until([&] { return admitted.load() == 3; }));
    EXPECT_EQ(limiter.active(), 4u);

    for (auto& w : waiters) {
        w.join();
    }
    for (int i = 0; i < 4; ++i) {
        limiter.release();
    }
    EXPECT_EQ(limiter.active(), 0u);
}

TEST_F(ConcurrencyLimiterTest, LoweringMaxGatesNewAdmissions) {
    concurrency_limiter limiter(3);
    limiter.acquire();
    limiter.acquire();

    limiter.set_max(1);
    EXPECT_FALSE(limiter.try_acquire());

    limiter.release();
    EXPECT_FALSE(limiter.try_acquire());

    limiter.release();
    EXPECT_TRUE(limiter.try_acquire());
    limiter.release();
}

// Stress test

TEST_F(ConcurrencyLimiterTest, ActiveNeverExceedsMaxUnderContention) {
    constexpr std::size_t capacity = 3;
    concurrency_limiter limiter(capacity);

    std::atomic<std::size_t> running{0};
    std::atomic<std::size_t> peak{0};
    std::atomic<bool> violated{false};

    std::vector<std::thread> workers;
    for (int t = 0; t < 12; ++t) {
        workers.emplace_back([&, t] {
            std::mt19937 gen(static_cast<unsigned>(t));
            std::uniform_int_distribution<int> pause(0, 200);
            for (int i = 0; i < 50; ++i) {
                scoped_slot slot(limiter);
                auto now = ++running;
                if (now > limiter.max()) {
                    violated = true;
                }
                auto prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::sleep_for(std::chrono::microseconds(pause(gen)));
                --running;
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_FALSE(violated.load());
    EXPECT_LE(peak.load(), capacity);
    EXPECT_EQ(limiter.active(), 0u);
}

}  // namespace cloudxfer::test
