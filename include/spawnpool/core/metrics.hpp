#pragma once

/**
 * @file metrics.hpp
 * @brief Pool counters and diagnostic snapshots
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <iostream>
#include <sstream>

namespace spawnpool {

/**
 * @brief Counter metric (monotonically increasing)
 */
class Counter {
public:
    void increment(std::uint64_t value = 1) noexcept {
        value_.fetch_add(value, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> value_{0};
};

/**
 * @brief Gauge metric (can go up and down)
 */
class Gauge {
public:
    void increment(std::int64_t delta = 1) noexcept {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    void decrement(std::int64_t delta = 1) noexcept {
        value_.fetch_sub(delta, std::memory_order_relaxed);
    }

    [[nodiscard]] std::int64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::int64_t> value_{0};
};

/**
 * @brief Point-in-time view of a pool
 */
struct PoolMetrics {
    std::uint64_t tasks_submitted{0};
    std::uint64_t tasks_completed{0};
    std::uint64_t tasks_failed{0};
    std::uint64_t workers_spawned{0};
    std::uint64_t workers_reused{0};
    std::uint64_t workers_reclaimed{0};   // idle timer fired
    std::uint64_t workers_discarded{0};   // found dying by a claimer
    std::uint64_t workers_failed{0};
    std::int64_t busy_workers{0};
    std::size_t idle_workers{0};
    std::size_t live_workers{0};
    std::chrono::milliseconds uptime{0};

    /**
     * @brief Format metrics as a single line
     */
    [[nodiscard]] std::string format() const {
        std::ostringstream oss;
        oss << "Tasks: " << tasks_submitted
            << " submitted / " << tasks_completed << " done / "
            << tasks_failed << " failed"
            << " | Workers: " << live_workers << " live, "
            << busy_workers << " busy, "
            << idle_workers << " idle"
            << " | Spawned: " << workers_spawned
            << " | Reused: " << workers_reused
            << " | Reclaimed: " << workers_reclaimed
            << " | Discarded: " << workers_discarded
            << " | Uptime: " << uptime.count() << " ms";
        return oss.str();
    }

    /**
     * @brief Print metrics to stdout
     */
    void print() const {
        std::cout << format() << std::endl;
    }
};

/**
 * @brief Counters updated by the pool and its workers
 */
class MetricsCollector {
public:
    MetricsCollector() : start_time_(std::chrono::steady_clock::now()) {}

    Counter& tasks_submitted() { return tasks_submitted_; }
    Counter& tasks_completed() { return tasks_completed_; }
    Counter& tasks_failed() { return tasks_failed_; }

    Counter& workers_spawned() { return workers_spawned_; }
    Counter& workers_reused() { return workers_reused_; }
    Counter& workers_reclaimed() { return workers_reclaimed_; }
    Counter& workers_discarded() { return workers_discarded_; }
    Counter& workers_failed() { return workers_failed_; }

    // Workers between a successful claim and the end of their task
    Gauge& busy_workers() { return busy_workers_; }

    /**
     * @brief Fill the counter part of a snapshot
     *
     * Gauges that live under the pool lock (idle and live workers) are
     * filled in by the caller.
     */
    [[nodiscard]] PoolMetrics snapshot() const {
        PoolMetrics m;
        m.tasks_submitted = tasks_submitted_.value();
        m.tasks_completed = tasks_completed_.value();
        m.tasks_failed = tasks_failed_.value();
        m.workers_spawned = workers_spawned_.value();
        m.workers_reused = workers_reused_.value();
        m.workers_reclaimed = workers_reclaimed_.value();
        m.workers_discarded = workers_discarded_.value();
        m.workers_failed = workers_failed_.value();
        m.busy_workers = busy_workers_.value();
        m.uptime = uptime();
        return m;
    }

    /**
     * @brief Get uptime
     */
    [[nodiscard]] std::chrono::milliseconds uptime() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_
        );
    }

private:
    std::chrono::steady_clock::time_point start_time_;

    Counter tasks_submitted_;
    Counter tasks_completed_;
    Counter tasks_failed_;
    Counter workers_spawned_;
    Counter workers_reused_;
    Counter workers_reclaimed_;
    Counter workers_discarded_;
    Counter workers_failed_;
    Gauge busy_workers_;
};

} // namespace spawnpool
