#pragma once

/**
 * @file worker.hpp
 * @brief Pooled worker thread and its status state machine
 */

#include <atomic>
#include <cstdint>
#include <memory>

#include "spawnpool/core/handoff.hpp"

namespace spawnpool {

namespace detail {
class PoolCore;
}

class Worker;

/**
 * @brief Worker status
 *
 * Idle -> InUse -> Idle is the reuse cycle. Idle -> Dying is taken by the
 * worker's own idle timer, Dying -> Dead by a claimer that popped a
 * worker which is already on its way out. Every transition is a
 * compare-and-swap from the exact prior state.
 */
enum class WorkerStatus : std::int32_t {
    Idle,
    InUse,
    Dying,
    Dead
};

[[nodiscard]] const char* to_string(WorkerStatus status) noexcept;

/**
 * @brief Intrusive free-list link
 *
 * The pool's sentinel head is a bare node; every worker is one too.
 * The link owns the next worker while it sits in the list.
 */
struct FreeListNode {
    std::shared_ptr<Worker> next;
};

/**
 * @brief Long-lived thread that executes handed-off tasks
 *
 * Created by the pool only. The thread is detached and keeps both itself
 * and the pool core alive until its loop returns.
 */
class Worker : public FreeListNode {
public:
    Worker(std::uint64_t id, detail::PoolCore* pool)
        : id_(id)
        , pool_(pool) {}

    // Non-copyable, non-movable
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * @brief Create a worker and start its loop
     * @param id Pool-local identifier
     * @param core Owning pool; shared with the worker thread
     * @return Worker in Idle status, not linked into any free list
     */
    static std::shared_ptr<Worker> spawn(
        std::uint64_t id,
        std::shared_ptr<detail::PoolCore> core
    );

    /**
     * @brief Claim for exclusive use (Idle -> InUse)
     */
    [[nodiscard]] bool try_claim() noexcept {
        return transition(WorkerStatus::Idle, WorkerStatus::InUse);
    }

    /**
     * @brief Give up after idling (Idle -> Dying)
     *
     * Fails when a claimer got there first, in which case the worker
     * stays alive and waits for the task that is on its way.
     */
    [[nodiscard]] bool try_retire() noexcept {
        return transition(WorkerStatus::Idle, WorkerStatus::Dying);
    }

    /**
     * @brief Mark a dying worker as discarded (Dying -> Dead)
     */
    bool discard_if_dying() noexcept {
        return transition(WorkerStatus::Dying, WorkerStatus::Dead);
    }

    /**
     * @brief Hand a task to the worker's loop
     * @return false if the worker's channel was closed
     */
    [[nodiscard]] bool hand_off(Task task) {
        return channel_.send(std::move(task));
    }

    [[nodiscard]] WorkerStatus status() const noexcept {
        return status_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }

private:
    friend class detail::PoolCore;

    bool transition(WorkerStatus from, WorkerStatus to) noexcept {
        return status_.compare_exchange_strong(
            from, to,
            std::memory_order_acq_rel,
            std::memory_order_acquire
        );
    }

    // Only the pool sets Idle, under its lock, on release
    void mark_idle() noexcept {
        status_.store(WorkerStatus::Idle, std::memory_order_release);
    }

    void close() { channel_.close(); }

    static void run(std::shared_ptr<Worker> self, std::shared_ptr<detail::PoolCore> core);
    void loop(const std::shared_ptr<Worker>& self);

    std::uint64_t id_;
    detail::PoolCore* pool_;
    HandoffChannel channel_;
    std::atomic<WorkerStatus> status_{WorkerStatus::Idle};
};

} // namespace spawnpool
