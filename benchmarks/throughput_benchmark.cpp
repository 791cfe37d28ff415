/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for spawnpool
 */

#include <benchmark/benchmark.h>
#include <atomic>
#include <chrono>
#include <thread>

#include "spawnpool/spawnpool.hpp"

using namespace spawnpool;

namespace {

void wait_for_count(const std::atomic<std::int64_t>& counter, std::int64_t expected) {
    while (counter.load(std::memory_order_acquire) < expected) {
        std::this_thread::yield();
    }
}

} // namespace

static void BM_PoolSubmitBatch(benchmark::State& state) {
    const auto batch = state.range(0);
    Pool pool(std::chrono::seconds(10));
    std::atomic<std::int64_t> done{0};

    for (auto _ : state) {
        done.store(0, std::memory_order_relaxed);
        for (std::int64_t i = 0; i < batch; i++) {
            pool.submit([&done] { done.fetch_add(1, std::memory_order_acq_rel); });
        }
        wait_for_count(done, batch);
    }

    state.SetItemsProcessed(state.iterations() * batch);
    state.counters["workers"] = static_cast<double>(pool.metrics().workers_spawned);
}
BENCHMARK(BM_PoolSubmitBatch)->Arg(1)->Arg(16)->Arg(256);

static void BM_ThreadPerTaskBatch(benchmark::State& state) {
    const auto batch = state.range(0);
    std::atomic<std::int64_t> done{0};

    for (auto _ : state) {
        done.store(0, std::memory_order_relaxed);
        for (std::int64_t i = 0; i < batch; i++) {
            std::thread([&done] { done.fetch_add(1, std::memory_order_acq_rel); }).detach();
        }
        wait_for_count(done, batch);
    }

    state.SetItemsProcessed(state.iterations() * batch);
}
BENCHMARK(BM_ThreadPerTaskBatch)->Arg(1)->Arg(16)->Arg(256);

static void BM_SequentialReuse(benchmark::State& state) {
    Pool pool(std::chrono::seconds(10));
    std::atomic<std::int64_t> done{0};
    std::int64_t expected = 0;

    for (auto _ : state) {
        pool.submit([&done] { done.fetch_add(1, std::memory_order_acq_rel); });
        wait_for_count(done, ++expected);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SequentialReuse);

static void BM_ConcurrentSubmitters(benchmark::State& state) {
    static Pool* pool = nullptr;
    static std::atomic<std::int64_t> done{0};

    if (state.thread_index() == 0) {
        pool = new Pool(std::chrono::seconds(10));
        done.store(0);
    }

    std::int64_t submitted = 0;
    for (auto _ : state) {
        pool->submit([] { done.fetch_add(1, std::memory_order_acq_rel); });
        submitted++;
    }

    state.SetItemsProcessed(submitted);

    if (state.thread_index() == 0) {
        delete pool;
        pool = nullptr;
    }
}
BENCHMARK(BM_ConcurrentSubmitters)->Threads(1)->Threads(4)->Threads(8);

BENCHMARK_MAIN();
