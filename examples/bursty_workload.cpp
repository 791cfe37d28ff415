/**
 * @file bursty_workload.cpp
 * @brief Example: bursts of short tasks separated by idle gaps
 *
 * Workers spawned for a burst are reused within it and reclaimed during
 * the gaps that outlast the idle timeout.
 */

#include <iostream>
#include <chrono>
#include <thread>
#include <csignal>
#include <atomic>
#include <cstdint>

#include "spawnpool/spawnpool.hpp"

std::atomic<bool> g_shutdown{false};

void signal_handler(int /*signal*/) {
    g_shutdown.store(true);
}

int main() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "=== spawnpool bursty workload ===" << std::endl;
    std::cout << "Version: " << spawnpool::VERSION << std::endl;
    std::cout << std::endl;

    spawnpool::PoolConfig config;
    config.idle_timeout = std::chrono::milliseconds(200);
    config.name = "bursty";

    spawnpool::Pool pool(config);

    constexpr int kBursts = 6;
    constexpr int kTasksPerBurst = 2000;
    std::atomic<std::uint64_t> checksum{0};

    for (int burst = 0; burst < kBursts && !g_shutdown.load(); burst++) {
        for (int i = 0; i < kTasksPerBurst; i++) {
            pool.submit([&checksum, i] {
                std::this_thread::sleep_for(std::chrono::microseconds(50));
                checksum.fetch_add(static_cast<std::uint64_t>(i), std::memory_order_relaxed);
            });
        }

        std::cout << "Burst " << burst + 1 << ": " << pool.metrics().format() << std::endl;

        // Odd gaps outlast the idle timeout, even ones do not
        auto gap = (burst % 2 == 1) ? std::chrono::milliseconds(500)
                                    : std::chrono::milliseconds(50);
        std::this_thread::sleep_for(gap);
    }

    std::cout << std::endl;
    std::cout << "Closing pool..." << std::endl;
    pool.close();
    pool.await_termination();

    auto m = pool.metrics();
    std::cout << "\n=== Final Statistics ===" << std::endl;
    std::cout << "Tasks completed: " << m.tasks_completed << std::endl;
    std::cout << "Checksum: " << checksum.load() << std::endl;
    std::cout << "Workers spawned: " << m.workers_spawned << std::endl;
    std::cout << "Workers reused: " << m.workers_reused << std::endl;
    std::cout << "Workers reclaimed: " << m.workers_reclaimed << std::endl;
    std::cout << "Workers discarded: " << m.workers_discarded << std::endl;
    std::cout << "Uptime: " << m.uptime.count() << " ms" << std::endl;

    return 0;
}
