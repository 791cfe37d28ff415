/**
 * @file pool.cpp
 * @brief Pool handle and the submit dispatch loop
 */

#include "spawnpool/core/pool.hpp"

#include <stdexcept>
#include <utility>

namespace spawnpool {

namespace {

PoolConfig config_with_timeout(std::chrono::nanoseconds idle_timeout) {
    PoolConfig config;
    config.idle_timeout = idle_timeout;
    return config;
}

} // namespace

Pool::Pool(std::chrono::nanoseconds idle_timeout)
    : Pool(config_with_timeout(idle_timeout)) {}

Pool::Pool(PoolConfig config)
    : core_(std::make_shared<detail::PoolCore>(std::move(config))) {}

Pool::~Pool() {
    close();
    await_termination();
}

void Pool::submit(Task work) {
    auto& metrics = core_->metrics();

    std::shared_ptr<Worker> worker;
    for (;;) {
        worker = core_->claim();
        if (worker->try_claim()) {
            break;
        }
        // Its idle timer won; drop it and look for another
        if (worker->discard_if_dying()) {
            metrics.workers_discarded().increment();
        }
    }

    metrics.tasks_submitted().increment();
    metrics.busy_workers().increment();

    // The worker puts itself back on the free list once work returns
    if (!worker->hand_off(std::move(work))) {
        metrics.busy_workers().decrement();
        throw std::runtime_error("Worker channel closed during hand-off");
    }
}

void Pool::close() {
    core_->close();
}

void Pool::await_termination() {
    core_->await_termination();
}

bool Pool::is_closed() const {
    return core_->is_closed();
}

std::size_t Pool::idle_count() const {
    return core_->idle_count();
}

std::size_t Pool::live_workers() const {
    return core_->live_workers();
}

PoolMetrics Pool::metrics() const {
    return core_->snapshot();
}

} // namespace spawnpool
