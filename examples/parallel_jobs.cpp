/**
 * @file parallel_jobs.cpp
 * @brief Example: fan CPU-bound jobs out to worker processes
 *
 * Counts primes in several ranges, once with blocking handles and once by
 * awaiting handles from a coroutine on an event loop.
 */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "procpool/procpool.hpp"

namespace {

std::int64_t count_primes(std::int64_t from, std::int64_t to) {
    std::int64_t count = 0;
    for (std::int64_t n = std::max<std::int64_t>(from, 2); n < to; n++) {
        bool prime = true;
        for (std::int64_t d = 2; d * d <= n; d++) {
            if (n % d == 0) {
                prime = false;
                break;
            }
        }
        if (prime) {
            count++;
        }
    }
    return count;
}

std::int64_t checked_sqrt(std::int64_t value) {
    if (value < 0) {
        throw std::domain_error("negative input: " + std::to_string(value));
    }
    std::int64_t root = 0;
    while ((root + 1) * (root + 1) <= value) {
        root++;
    }
    return root;
}

PROCPOOL_REGISTER(count_primes);
PROCPOOL_REGISTER(checked_sqrt);

constexpr std::int64_t RANGE = 200000;
constexpr int CHUNKS = 8;

procpool::Task<std::int64_t> count_awaited(procpool::WorkerPool& pool) {
    std::vector<std::shared_ptr<procpool::AsyncJobHandle<std::int64_t>>> handles;
    for (int i = 0; i < CHUNKS; i++) {
        handles.push_back(pool.submit(count_primes, i * RANGE, (i + 1) * RANGE));
    }

    std::int64_t total = 0;
    for (auto& handle : handles) {
        total += co_await *handle;
    }
    co_return total;
}

} // namespace

int main() {
    std::cout << "=== procpool Example: Parallel Jobs ===" << std::endl;
    std::cout << "Version: " << procpool::VERSION << std::endl;
    std::cout << std::endl;

    procpool::EventLoop loop;

    procpool::WorkerPoolConfig config;
    config.num_workers = 4;
    config.failure_policy = procpool::FailurePolicy::Surface;

    procpool::WorkerPoolResource resource(loop, config);
    procpool::ResourceScope<procpool::WorkerPool> pool(resource);

    std::cout << "Workers: " << pool->num_workers() << std::endl;

    // Blocking handles
    auto start = std::chrono::steady_clock::now();
    std::vector<std::shared_ptr<procpool::JobHandle<std::int64_t>>> handles;
    for (int i = 0; i < CHUNKS; i++) {
        handles.push_back(pool->submit_blocking(count_primes, i * RANGE, (i + 1) * RANGE));
    }

    std::int64_t total = 0;
    for (auto& handle : handles) {
        total += handle->join();
        std::cout << "  " << handle->to_string() << ": "
                  << handle->stats().elapsed_seconds() << "s" << std::endl;
    }
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::cout << "Blocking: " << total << " primes below " << CHUNKS * RANGE
              << " in " << elapsed << "s" << std::endl;

    // Awaited handles
    start = std::chrono::steady_clock::now();
    total = loop.run_until_complete(count_awaited(*pool));
    elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::cout << "Awaited:  " << total << " primes below " << CHUNKS * RANGE
              << " in " << elapsed << "s" << std::endl;

    // A failing job
    auto failing = pool->submit_blocking(checked_sqrt, -4);
    try {
        failing->join();
    } catch (const procpool::JobFailedError& e) {
        std::cout << "\nExpected failure: " << e.what() << std::endl;
    }

    std::cout << "\n=== Final Statistics ===" << std::endl;
    std::cout << pool->format_stats() << std::endl;
    std::cout << "Uptime: " << pool->metrics().uptime().count() << " ms" << std::endl;

    return 0;
}
