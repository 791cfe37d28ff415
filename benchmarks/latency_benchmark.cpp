/**
 * @file latency_benchmark.cpp
 * @brief Latency benchmarks for spawnpool
 */

#include <benchmark/benchmark.h>
#include <atomic>
#include <chrono>
#include <thread>

#include "spawnpool/spawnpool.hpp"

using namespace spawnpool;

// Time from submit() to the task starting on a warm, idle worker
static void BM_SubmitToStartLatency(benchmark::State& state) {
    Pool pool(std::chrono::seconds(10));
    std::atomic<bool> started{false};

    // Warm up one worker so every iteration reuses it
    pool.submit([] {});
    while (pool.idle_count() == 0) {
        std::this_thread::yield();
    }

    for (auto _ : state) {
        started.store(false, std::memory_order_relaxed);

        auto start = std::chrono::high_resolution_clock::now();
        pool.submit([&started] { started.store(true, std::memory_order_release); });
        while (!started.load(std::memory_order_acquire)) {
            std::this_thread::yield();
        }
        auto end = std::chrono::high_resolution_clock::now();

        // Let the worker get back on the free list before the next round
        state.PauseTiming();
        while (pool.idle_count() == 0) {
            std::this_thread::yield();
        }
        state.ResumeTiming();

        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
        state.SetIterationTime(static_cast<double>(duration.count()) / 1e9);
    }

    state.counters["spawned"] = static_cast<double>(pool.metrics().workers_spawned);
}
BENCHMARK(BM_SubmitToStartLatency)->UseManualTime();

// Same measurement when every task needs a fresh thread
static void BM_ThreadStartLatency(benchmark::State& state) {
    std::atomic<bool> started{false};

    for (auto _ : state) {
        started.store(false, std::memory_order_relaxed);

        auto start = std::chrono::high_resolution_clock::now();
        std::thread t([&started] { started.store(true, std::memory_order_release); });
        while (!started.load(std::memory_order_acquire)) {
            std::this_thread::yield();
        }
        auto end = std::chrono::high_resolution_clock::now();

        state.PauseTiming();
        t.join();
        state.ResumeTiming();

        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
        state.SetIterationTime(static_cast<double>(duration.count()) / 1e9);
    }
}
BENCHMARK(BM_ThreadStartLatency)->UseManualTime();

// Raw rendezvous cost of the handoff channel
static void BM_HandoffRoundTrip(benchmark::State& state) {
    HandoffChannel channel;
    std::atomic<bool> stop{false};

    std::thread receiver([&] {
        while (!stop.load(std::memory_order_acquire)) {
            auto task = channel.receive_for(std::chrono::milliseconds(10));
            if (task) {
                (*task)();
            }
        }
    });

    for (auto _ : state) {
        bool ok = channel.send([] {});
        benchmark::DoNotOptimize(ok);
    }

    stop.store(true, std::memory_order_release);
    channel.close();
    receiver.join();

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_HandoffRoundTrip);

BENCHMARK_MAIN();
