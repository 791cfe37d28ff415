#pragma once

/**
 * @file pool.hpp
 * @brief Public pool handle: construct, submit, close
 */

#include <chrono>
#include <memory>

#include "spawnpool/core/handoff.hpp"
#include "spawnpool/core/metrics.hpp"
#include "spawnpool/core/pool_core.hpp"

namespace spawnpool {

/**
 * @brief Pool of reusable worker threads
 *
 * submit() hands a task to an idle worker, spawning a new one when none
 * is idle, and returns as soon as the worker has taken the task. There is
 * no upper bound on the number of workers and no work queue. A worker
 * that stays idle for longer than the idle timeout exits on its own.
 *
 * Destroying the pool closes it and waits for running tasks to finish.
 */
class Pool {
public:
    /**
     * @brief Create an empty pool with the given idle timeout
     * @throws std::invalid_argument if idle_timeout is not positive
     */
    explicit Pool(std::chrono::nanoseconds idle_timeout);

    /**
     * @brief Create an empty pool from a full configuration
     * @throws std::invalid_argument if config.idle_timeout is not positive
     */
    explicit Pool(PoolConfig config);

    ~Pool();

    // Non-copyable, non-movable
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    /**
     * @brief Run work on some worker, without waiting for it to finish
     *
     * Exceptions escaping work end the worker that ran it; they are
     * logged and counted but never reach the caller.
     * @throws std::runtime_error if the pool is closed
     */
    void submit(Task work);

    /**
     * @brief Refuse further submissions and retire idle workers
     *
     * Workers busy with a task finish it and then exit. Idempotent.
     */
    void close();

    /**
     * @brief Wait until every worker has exited
     *
     * Only returns once the pool is closed or all workers have timed out.
     */
    void await_termination();

    [[nodiscard]] bool is_closed() const;

    /**
     * @brief Number of workers currently in the free list
     */
    [[nodiscard]] std::size_t idle_count() const;

    /**
     * @brief Number of worker threads still inside their loop
     */
    [[nodiscard]] std::size_t live_workers() const;

    [[nodiscard]] PoolMetrics metrics() const;

    [[nodiscard]] const PoolConfig& config() const noexcept { return core_->config(); }

private:
    std::shared_ptr<detail::PoolCore> core_;
};

} // namespace spawnpool
