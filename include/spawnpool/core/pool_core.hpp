#pragma once

/**
 * @file pool_core.hpp
 * @brief Free list and worker bookkeeping shared by a pool and its workers
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "spawnpool/core/metrics.hpp"
#include "spawnpool/core/worker.hpp"

namespace spawnpool {

/**
 * @brief Pool configuration
 */
struct PoolConfig {
    std::chrono::nanoseconds idle_timeout{std::chrono::seconds(1)};  // must be positive
    std::string name{"spawnpool"};  // log prefix
    bool log_failures{true};        // report workers killed by a task on stderr
};

namespace detail {

/**
 * @brief State behind a Pool handle
 *
 * Owned jointly by the Pool and every live worker thread, so a worker
 * finishing a task after the handle is gone still has a free list to
 * return to. The mutex covers the free list, the closed flag and the
 * live-worker count, and is never held while a task runs.
 */
class PoolCore : public std::enable_shared_from_this<PoolCore> {
public:
    /**
     * @throws std::invalid_argument if config.idle_timeout is not positive
     */
    explicit PoolCore(PoolConfig config);
    ~PoolCore();

    // Non-copyable, non-movable
    PoolCore(const PoolCore&) = delete;
    PoolCore& operator=(const PoolCore&) = delete;

    /**
     * @brief Pop the oldest idle worker, or allocate one if none is idle
     *
     * The returned worker is not yet claimed; it may already be Dying.
     * @throws std::runtime_error if the pool is closed
     */
    std::shared_ptr<Worker> claim();

    /**
     * @brief Append a worker that finished its task and mark it Idle
     * @return false if the pool is closed; the worker must then exit
     */
    [[nodiscard]] bool release(const std::shared_ptr<Worker>& worker);

    /**
     * @brief Stop handing out workers and retire the idle ones
     */
    void close();

    /**
     * @brief Block until every worker thread has left its loop
     */
    void await_termination();

    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] std::size_t idle_count() const;
    [[nodiscard]] std::size_t live_workers() const;
    [[nodiscard]] PoolMetrics snapshot() const;

    [[nodiscard]] std::chrono::nanoseconds idle_timeout() const noexcept { return config_.idle_timeout; }
    [[nodiscard]] const PoolConfig& config() const noexcept { return config_; }
    [[nodiscard]] MetricsCollector& metrics() noexcept { return metrics_; }

    // Called from worker threads
    void on_worker_failed(std::uint64_t worker_id, const char* what);
    void on_worker_exit();

private:
    // Spawns a worker already counted in live_ by claim()
    std::shared_ptr<Worker> alloc();

    PoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable terminated_;
    FreeListNode head_;
    FreeListNode* tail_{&head_};
    std::size_t count_{0};
    std::size_t live_{0};
    bool closed_{false};

    std::atomic<std::uint64_t> next_id_{1};
    MetricsCollector metrics_;
};

} // namespace detail
} // namespace spawnpool
