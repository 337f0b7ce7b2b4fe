/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for procpool's in-process building blocks
 */

#include <benchmark/benchmark.h>

#include <string>

#include "procpool/procpool.hpp"

using namespace procpool;

namespace {

std::int64_t bench_sum(std::int64_t a, std::int64_t b) {
    return a + b;
}

PROCPOOL_REGISTER(bench_sum);

Job sample_job(std::size_t payload_bytes) {
    Job job(1, "bench_sum", {
        Value{std::int64_t{42}},
        Value{std::string(payload_bytes, 'x')},
    });
    job.set_stats(JobStats());
    return job;
}

} // namespace

static void BM_QueuePushPop(benchmark::State& state) {
    UnboundedQueue<Blob> queue;

    for (auto _ : state) {
        queue.push(Blob(64));
        auto result = queue.pop();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueuePushPop);

static void BM_QueueTryPop(benchmark::State& state) {
    UnboundedQueue<int> queue;

    for (auto _ : state) {
        queue.push(42);
        auto result = queue.try_pop();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueueTryPop);

static void BM_EncodeJob(benchmark::State& state) {
    Job job = sample_job(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        auto bytes = encode_job(job);
        benchmark::DoNotOptimize(bytes);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeJob)->Arg(16)->Arg(1024)->Arg(64 * 1024);

static void BM_DecodeJob(benchmark::State& state) {
    Blob bytes = encode_job(sample_job(static_cast<std::size_t>(state.range(0))));

    for (auto _ : state) {
        auto job = decode_job(bytes);
        benchmark::DoNotOptimize(job);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DecodeJob)->Arg(16)->Arg(1024)->Arg(64 * 1024);

static void BM_EvaluateJobInProcess(benchmark::State& state) {
    Job job(1, "bench_sum", {Value{std::int64_t{40}}, Value{std::int64_t{2}}});
    job.set_stats(JobStats());

    for (auto _ : state) {
        auto done = evaluate_job(job);
        benchmark::DoNotOptimize(done);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_EvaluateJobInProcess);

static void BM_ValueConversion(benchmark::State& state) {
    for (auto _ : state) {
        Value v = to_value(std::int64_t{42});
        auto back = from_value<std::int64_t>(v);
        benchmark::DoNotOptimize(back);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValueConversion);

BENCHMARK_MAIN();
