/**
 * @file latency_benchmark.cpp
 * @brief Round-trip latency of jobs through worker processes
 */

#include <benchmark/benchmark.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "procpool/procpool.hpp"

using namespace procpool;

namespace {

std::int64_t bench_identity(std::int64_t value) {
    return value;
}

std::string bench_payload(std::string payload) {
    return payload;
}

PROCPOOL_REGISTER(bench_identity);
PROCPOOL_REGISTER(bench_payload);

WorkerPoolConfig config_with(std::int64_t workers) {
    WorkerPoolConfig config;
    config.num_workers = static_cast<std::uint32_t>(workers);
    return config;
}

} // namespace

static void BM_BlockingRoundTrip(benchmark::State& state) {
    Logger::set_level(LogLevel::WARN);
    WorkerPool pool(config_with(1));

    std::int64_t i = 0;
    for (auto _ : state) {
        auto result = pool.submit_blocking(bench_identity, i++)->join();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BlockingRoundTrip)->UseRealTime();

static void BM_PayloadRoundTrip(benchmark::State& state) {
    Logger::set_level(LogLevel::WARN);
    WorkerPool pool(config_with(1));
    std::string payload(static_cast<std::size_t>(state.range(0)), 'p');

    for (auto _ : state) {
        auto result = pool.submit_blocking(bench_payload, payload)->join();
        benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0) * 2);
}
BENCHMARK(BM_PayloadRoundTrip)->Arg(64)->Arg(4096)->Arg(256 * 1024)->UseRealTime();

static void BM_BatchLatency(benchmark::State& state) {
    Logger::set_level(LogLevel::WARN);
    WorkerPool pool(config_with(state.range(0)));
    constexpr int batch = 256;

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        std::vector<std::shared_ptr<JobHandle<std::int64_t>>> handles;
        handles.reserve(batch);
        for (std::int64_t i = 0; i < batch; i++) {
            handles.push_back(pool.submit_blocking(bench_identity, i));
        }
        for (auto& handle : handles) {
            benchmark::DoNotOptimize(handle->join());
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(duration.count() / 1e6);
    }

    state.SetItemsProcessed(state.iterations() * batch);
}
BENCHMARK(BM_BatchLatency)->Arg(1)->Arg(2)->Arg(4)->UseManualTime();

static void BM_AwaitedBatch(benchmark::State& state) {
    Logger::set_level(LogLevel::WARN);
    EventLoop loop;
    WorkerPool pool(loop, config_with(state.range(0)));
    constexpr int batch = 256;

    auto run_batch = [&]() -> Task<std::int64_t> {
        std::vector<std::shared_ptr<AsyncJobHandle<std::int64_t>>> handles;
        handles.reserve(batch);
        for (std::int64_t i = 0; i < batch; i++) {
            handles.push_back(pool.submit(bench_identity, i));
        }
        std::int64_t total = 0;
        for (auto& handle : handles) {
            total += co_await *handle;
        }
        co_return total;
    };

    for (auto _ : state) {
        auto total = loop.run_until_complete(run_batch());
        benchmark::DoNotOptimize(total);
    }

    state.SetItemsProcessed(state.iterations() * batch);
}
BENCHMARK(BM_AwaitedBatch)->Arg(1)->Arg(2)->Arg(4)->UseRealTime();

BENCHMARK_MAIN();
