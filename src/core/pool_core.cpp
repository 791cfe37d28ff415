/**
 * @file pool_core.cpp
 * @brief Free-list operations and worker accounting
 */

#include "spawnpool/core/pool_core.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace spawnpool {
namespace detail {

PoolCore::PoolCore(PoolConfig config)
    : config_(std::move(config)) {
    if (config_.idle_timeout <= std::chrono::nanoseconds::zero()) {
        throw std::invalid_argument("idle_timeout must be positive");
    }
}

PoolCore::~PoolCore() {
    // Unlink iteratively; a long chain of owning links would otherwise
    // be destroyed recursively
    auto node = std::move(head_.next);
    while (node) {
        node = std::move(node->next);
    }
}

std::shared_ptr<Worker> PoolCore::claim() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (closed_) {
        throw std::runtime_error("Pool is closed");
    }

    if (!head_.next) {
        // Counted under the same lock as the closed check, so close() and
        // await_termination() cannot miss a worker about to be spawned
        live_++;
        lock.unlock();
        return alloc();
    }

    // Moving out of the links leaves ret->next empty
    std::shared_ptr<Worker> ret = std::move(head_.next);
    head_.next = std::move(ret->next);
    if (tail_ == ret.get()) {
        tail_ = &head_;
    }
    count_--;
    lock.unlock();

    // Counts workers later found dying too
    metrics_.workers_reused().increment();
    return ret;
}

bool PoolCore::release(const std::shared_ptr<Worker>& worker) {
    worker->next.reset();

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }

    tail_->next = worker;
    tail_ = worker.get();
    count_++;
    worker->mark_idle();
    return true;
}

std::shared_ptr<Worker> PoolCore::alloc() {
    try {
        auto worker = Worker::spawn(
            next_id_.fetch_add(1, std::memory_order_relaxed),
            shared_from_this()
        );
        metrics_.workers_spawned().increment();
        return worker;
    } catch (...) {
        // Thread creation failed; undo the accounting and let the caller see why
        on_worker_exit();
        throw;
    }
}

void PoolCore::close() {
    std::shared_ptr<Worker> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        idle = std::move(head_.next);
        tail_ = &head_;
        count_ = 0;
    }

    // Wake every idle worker so it exits now instead of at its timeout
    while (idle) {
        auto next = std::move(idle->next);
        idle->close();
        idle = std::move(next);
    }
}

void PoolCore::await_termination() {
    std::unique_lock<std::mutex> lock(mutex_);
    terminated_.wait(lock, [this] { return live_ == 0; });
}

bool PoolCore::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t PoolCore::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

std::size_t PoolCore::live_workers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_;
}

PoolMetrics PoolCore::snapshot() const {
    auto m = metrics_.snapshot();
    std::lock_guard<std::mutex> lock(mutex_);
    m.idle_workers = count_;
    m.live_workers = live_;
    return m;
}

void PoolCore::on_worker_failed(std::uint64_t worker_id, const char* what) {
    metrics_.tasks_failed().increment();
    metrics_.workers_failed().increment();
    metrics_.busy_workers().decrement();

    if (config_.log_failures) {
        std::cerr << "[" << config_.name << "] worker " << worker_id
                  << " terminated: " << what << std::endl;
    }
}

void PoolCore::on_worker_exit() {
    std::lock_guard<std::mutex> lock(mutex_);
    live_--;
    if (live_ == 0) {
        terminated_.notify_all();
    }
}

} // namespace detail
} // namespace spawnpool
