/**
 * @file worker_pool.cpp
 * @brief Worker pool implementation
 */

#include "procpool/core/worker_pool.hpp"

namespace procpool {

WorkerPool::WorkerPool(EventLoop& loop, WorkerPoolConfig config, const FunctionRegistry& registry)
    : WorkerPool(config, registry)
{
    loop_ = &loop;
}

WorkerPool::WorkerPool(WorkerPoolConfig config, const FunctionRegistry& registry)
    : config_(config)
    , registry_(registry)
    , process_pool_(std::make_unique<ProcessPool>(ProcessPoolConfig{config.num_workers}, registry))
{
    config_.num_workers = process_pool_->num_workers();
    LOG_DEBUG("worker pool created with " + std::to_string(config_.num_workers) + " workers");
}

WorkerPool::~WorkerPool() {
    terminate();
}

void WorkerPool::terminate() noexcept {
    if (state_.exchange(WorkerPoolState::Closed, std::memory_order_acq_rel) == WorkerPoolState::Closed) {
        return;
    }
    process_pool_->terminate();
    LOG_DEBUG("worker pool terminated");
}

std::string WorkerPool::format_stats() const {
    auto pool_stats = process_pool_->stats();
    return metrics_.format()
        + " | Queued: " + std::to_string(pool_stats.tasks_queued)
        + " | Respawned: " + std::to_string(pool_stats.workers_respawned);
}

Job WorkerPool::make_job(std::string function, ValueList args) {
    if (state() == WorkerPoolState::Closed) {
        throw PoolClosedError();
    }

    Job job(next_job_id(), std::move(function), std::move(args));
    job.set_stats(JobStats(std::chrono::steady_clock::now()));
    return job;
}

std::shared_ptr<PoolTask> WorkerPool::apply(Job job, std::shared_ptr<JobCompletion> completion) {
    auto on_success = [this, completion](Job done) {
        double elapsed = done.stats() ? done.stats()->elapsed_seconds() : 0.0;
        metrics_.record_completion(done.failed(), elapsed);
        completion->on_success(std::move(done));
    };

    auto on_error = [this, completion](std::exception_ptr error) {
        metrics_.record_pool_failure();
        completion->on_failure(std::move(error));
    };

    metrics_.jobs_in_flight().increment();
    try {
        auto task = process_pool_->apply_async(std::move(job), std::move(on_success), std::move(on_error));
        metrics_.jobs_submitted().increment();
        return task;
    } catch (const std::exception&) {
        metrics_.jobs_in_flight().decrement();
        throw;
    }
}

JobId WorkerPool::next_job_id() noexcept {
    return last_job_id_.fetch_add(1, std::memory_order_relaxed) + 1;
}

} // namespace procpool
