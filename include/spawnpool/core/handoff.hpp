#pragma once

/**
 * @file handoff.hpp
 * @brief Unbuffered rendezvous channel carrying one task at a time
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace spawnpool {

/**
 * @brief Unit of work accepted by the pool
 */
using Task = std::function<void()>;

/**
 * @brief Handoff channel statistics
 */
struct HandoffStats {
    std::uint64_t send_count{0};
    std::uint64_t receive_count{0};
    std::uint64_t receive_timeouts{0};
};

/**
 * @brief Synchronous single-slot channel
 *
 * A send completes only once a receiver has taken the task, so the slot
 * never holds more than one item and a sender is released as soon as the
 * receiving side owns the work. Receivers wait with a deadline, which is
 * how a worker combines "wait for work" with its idle timer.
 */
class HandoffChannel {
public:
    HandoffChannel() = default;

    // Non-copyable, non-movable (due to synchronization primitives)
    HandoffChannel(const HandoffChannel&) = delete;
    HandoffChannel& operator=(const HandoffChannel&) = delete;
    HandoffChannel(HandoffChannel&&) = delete;
    HandoffChannel& operator=(HandoffChannel&&) = delete;

    /**
     * @brief Hand a task to the receiver, blocking until it is taken
     * @param task Task to hand over
     * @return true if a receiver took the task, false if the channel was
     *         closed first (the task is dropped)
     */
    [[nodiscard]] bool send(Task task) {
        std::unique_lock<std::mutex> lock(mutex_);

        // Wait for the slot (only matters with concurrent senders)
        slot_free_.wait(lock, [this] { return !full_ || closed_; });
        if (closed_) {
            return false;
        }

        slot_ = std::move(task);
        full_ = true;
        const std::uint64_t ticket = ++sent_;
        stats_.send_count++;
        has_item_.notify_one();

        taken_.wait(lock, [this, ticket] { return received_ >= ticket || closed_; });
        if (received_ >= ticket) {
            return true;
        }

        // Closed before anyone took it
        slot_ = nullptr;
        full_ = false;
        return false;
    }

    /**
     * @brief Wait up to timeout for a task
     * @param timeout Maximum wait duration
     * @return Task if one was handed over, nullopt on timeout or closure
     */
    template<typename Rep, typename Period>
    std::optional<Task> receive_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!has_item_.wait_for(lock, timeout, [this] {
            return full_ || closed_;
        })) {
            stats_.receive_timeouts++;
            return std::nullopt;
        }

        if (!full_) {
            return std::nullopt;
        }

        Task task = std::move(slot_);
        slot_ = nullptr;
        full_ = false;
        ++received_;
        stats_.receive_count++;

        lock.unlock();
        taken_.notify_all();
        slot_free_.notify_one();

        return task;
    }

    /**
     * @brief Close the channel, waking any blocked sender or receiver
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        has_item_.notify_all();
        taken_.notify_all();
        slot_free_.notify_all();
    }

    /**
     * @brief Check if channel is closed
     */
    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * @brief Get channel statistics
     */
    [[nodiscard]] HandoffStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable has_item_;
    std::condition_variable taken_;
    std::condition_variable slot_free_;

    Task slot_;
    bool full_{false};
    bool closed_{false};
    std::uint64_t sent_{0};
    std::uint64_t received_{0};

    HandoffStats stats_;
};

} // namespace spawnpool
