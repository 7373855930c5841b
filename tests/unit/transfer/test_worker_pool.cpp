/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for the bounded transfer worker pool
 */

#include <gtest/gtest.h>

#include <edgefirst/sync/transfer/worker_pool.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace edgefirst::sync::test {

using namespace std::chrono_literals;

class WorkerPoolTest : public ::testing::Test {};

TEST_F(WorkerPoolTest, ReturnsJobResults) {
    transfer_worker_pool pool(2);

    auto ok = pool.submit<int>([]() -> result<int> { return 7; });
    auto bad = pool.submit<int>([]() -> result<int> {
        return unexpected{error{error_code::internal_error, "boom"}};
    });

    auto first = ok.get();
    auto second = bad.get();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 7);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::internal_error);
}

TEST_F(WorkerPoolTest, NeverExceedsCapacity) {
    constexpr std::size_t capacity = 3;
    transfer_worker_pool pool(capacity, adapters::executor_factory::create(8));

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<std::future<result<void>>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.submit<void>([&]() -> result<void> {
            auto now = ++active;
            auto seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(2ms);
            --active;
            return {};
        }));
    }
    for (auto& f : futures) {
        EXPECT_TRUE(f.get().has_value());
    }
    pool.wait_idle();

    EXPECT_LE(peak.load(), static_cast<int>(capacity));
    EXPECT_LE(pool.peak_in_flight(), capacity);
    EXPECT_EQ(pool.submitted(), 20u);
    EXPECT_EQ(pool.completed(), 20u);
    EXPECT_EQ(pool.in_flight(), 0u);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST_F(WorkerPoolTest, CapacityOfOneSerializes) {
    transfer_worker_pool pool(1);

    std::vector<int> order;
    std::mutex order_mutex;
    std::vector<std::future<result<void>>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(pool.submit<void>([&, i]() -> result<void> {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(i);
            return {};
        }));
    }
    for (auto& f : futures) {
        (void)f.get();
    }
    pool.wait_idle();

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(pool.peak_in_flight(), 1u);
}

TEST_F(WorkerPoolTest, ZeroCapacityClamped) {
    transfer_worker_pool pool(0);
    EXPECT_EQ(pool.capacity(), 1u);
}

TEST_F(WorkerPoolTest, WaitIdleWithNoWork) {
    transfer_worker_pool pool(2);
    pool.wait_idle();
    EXPECT_EQ(pool.submitted(), 0u);
}

}  // namespace edgefirst::sync::test
