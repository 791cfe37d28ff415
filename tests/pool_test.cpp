/**
 * @file pool_test.cpp
 * @brief End-to-end tests for Pool submit, reuse and reclamation
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "spawnpool/spawnpool.hpp"

using namespace spawnpool;
using namespace std::chrono_literals;

namespace {

bool wait_until(const std::function<bool()>& pred,
                std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

} // namespace

class PoolTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(PoolTest, StartsEmpty) {
    Pool pool(50ms);

    EXPECT_FALSE(pool.is_closed());
    EXPECT_EQ(pool.idle_count(), 0u);
    EXPECT_EQ(pool.live_workers(), 0u);

    auto m = pool.metrics();
    EXPECT_EQ(m.workers_spawned, 0u);
    EXPECT_EQ(m.tasks_submitted, 0u);
    EXPECT_EQ(pool.config().idle_timeout, 50ms);
}

TEST_F(PoolTest, RejectsNonPositiveTimeout) {
    EXPECT_THROW(Pool(0ms), std::invalid_argument);

    PoolConfig config;
    config.idle_timeout = -1ms;
    EXPECT_THROW(Pool{config}, std::invalid_argument);
}

TEST_F(PoolTest, SubmitRunsWork) {
    Pool pool(1s);
    std::atomic<int> value{0};

    pool.submit([&] { value.store(7); });

    ASSERT_TRUE(wait_until([&] { return value.load() == 7; }));
    ASSERT_TRUE(wait_until([&] { return pool.metrics().tasks_completed == 1; }));
    EXPECT_EQ(pool.metrics().tasks_submitted, 1u);
}

TEST_F(PoolTest, SubmitReturnsBeforeWorkFinishes) {
    Pool pool(1s);
    std::atomic<bool> release{false};
    std::atomic<bool> done{false};

    auto start = std::chrono::steady_clock::now();
    pool.submit([&] {
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
        done.store(true);
    });
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(done.load());
    EXPECT_LT(elapsed, 1s);
    EXPECT_EQ(pool.metrics().busy_workers, 1);

    release.store(true);
    ASSERT_TRUE(wait_until([&] { return done.load(); }));
}

TEST_F(PoolTest, SequentialSubmitsReuseWorker) {
    Pool pool(5s);
    std::atomic<int> runs{0};

    for (int i = 0; i < 10; i++) {
        pool.submit([&] { runs.fetch_add(1); });
        // Wait until the worker is back on the free list
        ASSERT_TRUE(wait_until([&] { return pool.idle_count() == 1; }));
    }

    EXPECT_EQ(runs.load(), 10);

    auto m = pool.metrics();
    EXPECT_EQ(m.workers_spawned, 1u);
    EXPECT_EQ(m.workers_reused, 9u);
    EXPECT_EQ(m.live_workers, 1u);
}

TEST_F(PoolTest, BusyWorkerIsNotReused) {
    Pool pool(5s);
    std::atomic<bool> release{false};
    std::atomic<int> runs{0};

    pool.submit([&] {
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
        runs.fetch_add(1);
    });
    pool.submit([&] { runs.fetch_add(1); });

    ASSERT_TRUE(wait_until([&] { return runs.load() == 1; }));
    EXPECT_EQ(pool.metrics().workers_spawned, 2u);

    release.store(true);
    ASSERT_TRUE(wait_until([&] { return runs.load() == 2; }));
}

TEST_F(PoolTest, IdleWorkerIsReclaimed) {
    Pool pool(50ms);
    std::atomic<int> runs{0};

    pool.submit([&] { runs.fetch_add(1); });
    ASSERT_TRUE(wait_until([&] { return pool.idle_count() == 1; }));

    std::this_thread::sleep_for(200ms);
    ASSERT_TRUE(wait_until([&] { return pool.live_workers() == 0; }));
    EXPECT_EQ(pool.metrics().workers_reclaimed, 1u);

    // The stale node is discarded and a brand-new worker takes the task
    pool.submit([&] { runs.fetch_add(1); });
    ASSERT_TRUE(wait_until([&] { return runs.load() == 2; }));

    auto m = pool.metrics();
    EXPECT_EQ(m.workers_spawned, 2u);
    EXPECT_EQ(m.workers_discarded, 1u);
}

TEST_F(PoolTest, ConcurrentSubmitsRunExactlyOnce) {
    Pool pool(1s);
    std::atomic<int> counter{0};

    constexpr int kThreads = 8;
    constexpr int kPerThread = 125;

    std::vector<std::thread> submitters;
    for (int t = 0; t < kThreads; t++) {
        submitters.emplace_back([&] {
            for (int i = 0; i < kPerThread; i++) {
                pool.submit([&] { counter.fetch_add(1); });
            }
        });
    }
    for (auto& t : submitters) {
        t.join();
    }

    ASSERT_TRUE(wait_until([&] { return counter.load() == kThreads * kPerThread; }));

    // Nothing runs twice
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(counter.load(), 1000);
    EXPECT_EQ(pool.metrics().tasks_submitted, 1000u);
}

TEST_F(PoolTest, SubmitsRacingIdleTimeouts) {
    // Timeout short enough that workers keep expiring between submissions
    Pool pool(1ms);

    constexpr int kTasks = 500;
    std::vector<std::atomic<int>> hits(kTasks);
    for (auto& h : hits) {
        h.store(0);
    }

    for (int i = 0; i < kTasks; i++) {
        pool.submit([&hits, i] { hits[i].fetch_add(1); });
        if (i % 10 == 0) {
            std::this_thread::sleep_for(std::chrono::microseconds(500 + (i % 7) * 200));
        }
    }

    ASSERT_TRUE(wait_until([&] { return pool.metrics().tasks_completed == kTasks; }));
    for (int i = 0; i < kTasks; i++) {
        EXPECT_EQ(hits[i].load(), 1) << "task " << i;
    }
    EXPECT_EQ(pool.metrics().tasks_submitted, static_cast<std::uint64_t>(kTasks));
}

TEST_F(PoolTest, ThrowingTaskEndsOnlyItsWorker) {
    PoolConfig config;
    config.idle_timeout = 5s;
    config.log_failures = false;
    Pool pool(config);

    pool.submit([] { throw std::runtime_error("boom"); });
    ASSERT_TRUE(wait_until([&] { return pool.metrics().workers_failed == 1; }));
    ASSERT_TRUE(wait_until([&] { return pool.live_workers() == 0; }));

    auto m = pool.metrics();
    EXPECT_EQ(m.tasks_failed, 1u);
    EXPECT_EQ(m.tasks_completed, 0u);
    EXPECT_EQ(m.busy_workers, 0);

    // The pool keeps serving with a new worker
    std::atomic<bool> ran{false};
    pool.submit([&] { ran.store(true); });
    ASSERT_TRUE(wait_until([&] { return ran.load(); }));
    EXPECT_EQ(pool.metrics().workers_spawned, 2u);
}

TEST_F(PoolTest, SubmitAfterCloseThrows) {
    Pool pool(1s);
    pool.close();
    pool.close();  // idempotent

    EXPECT_TRUE(pool.is_closed());
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);
    EXPECT_EQ(pool.metrics().tasks_submitted, 0u);
}

TEST_F(PoolTest, CloseDrainsIdleWorkers) {
    Pool pool(1h);
    std::atomic<int> runs{0};

    pool.submit([&] { runs.fetch_add(1); });
    pool.submit([&] { runs.fetch_add(1); });
    ASSERT_TRUE(wait_until([&] { return runs.load() == 2; }));
    ASSERT_TRUE(wait_until([&] { return pool.metrics().tasks_completed == 2; }));

    pool.close();
    pool.await_termination();

    EXPECT_EQ(pool.live_workers(), 0u);
    EXPECT_EQ(pool.idle_count(), 0u);
}

TEST_F(PoolTest, DestructorWaitsForRunningWork) {
    std::atomic<bool> done{false};
    {
        Pool pool(1h);
        pool.submit([&] {
            std::this_thread::sleep_for(100ms);
            done.store(true);
        });
    }
    EXPECT_TRUE(done.load());
}

TEST_F(PoolTest, MetricsFormat) {
    PoolConfig config;
    config.idle_timeout = 1s;
    config.name = "formatter";
    Pool pool(config);

    pool.submit([] {});
    ASSERT_TRUE(wait_until([&] { return pool.idle_count() == 1; }));

    EXPECT_EQ(pool.config().name, "formatter");
    auto line = pool.metrics().format();
    EXPECT_NE(line.find("Spawned: 1"), std::string::npos);
    EXPECT_NE(line.find("1 idle"), std::string::npos);
}
