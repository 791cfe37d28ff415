/**
 * @file worker.cpp
 * @brief Worker thread loop and idle reclamation
 */

#include "spawnpool/core/worker.hpp"
#include "spawnpool/core/pool_core.hpp"

#include <exception>
#include <thread>

namespace spawnpool {

const char* to_string(WorkerStatus status) noexcept {
    switch (status) {
        case WorkerStatus::Idle:  return "idle";
        case WorkerStatus::InUse: return "in-use";
        case WorkerStatus::Dying: return "dying";
        case WorkerStatus::Dead:  return "dead";
    }
    return "unknown";
}

std::shared_ptr<Worker> Worker::spawn(
    std::uint64_t id,
    std::shared_ptr<detail::PoolCore> core
) {
    auto worker = std::make_shared<Worker>(id, core.get());
    std::thread(&Worker::run, worker, std::move(core)).detach();
    return worker;
}

void Worker::run(std::shared_ptr<Worker> self, std::shared_ptr<detail::PoolCore> core) {
    // A task that throws takes its worker down with it. The thread ends
    // here instead of taking the process down.
    try {
        self->loop(self);
    } catch (const std::exception& e) {
        core->on_worker_failed(self->id_, e.what());
    } catch (...) {
        core->on_worker_failed(self->id_, "non-standard exception");
    }
    core->on_worker_exit();
}

void Worker::loop(const std::shared_ptr<Worker>& self) {
    for (;;) {
        auto task = channel_.receive_for(pool_->idle_timeout());

        if (!task) {
            if (channel_.is_closed()) {
                // Detached from a closed pool's free list; unreachable by claimers
                static_cast<void>(try_retire());
                return;
            }

            if (try_retire()) {
                pool_->metrics().workers_reclaimed().increment();
                return;
            }

            // Claimed between the timeout and the CAS; the task is on its way
            continue;
        }

        (*task)();
        pool_->metrics().tasks_completed().increment();
        pool_->metrics().busy_workers().decrement();

        if (!pool_->release(self)) {
            return;
        }
    }
}

} // namespace spawnpool
