#pragma once

/**
 * @file worker_pool.hpp
 * @brief Job submission front end over the process pool
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "procpool/core/errors.hpp"
#include "procpool/core/event_loop.hpp"
#include "procpool/core/future.hpp"
#include "procpool/core/handle.hpp"
#include "procpool/core/job.hpp"
#include "procpool/core/logger.hpp"
#include "procpool/core/metrics.hpp"
#include "procpool/core/process_pool.hpp"
#include "procpool/core/registry.hpp"

namespace procpool {

/**
 * @brief Configuration for worker pool
 */
struct WorkerPoolConfig {
    std::uint32_t num_workers{0};  // 0 = auto-detect
    FailurePolicy failure_policy{FailurePolicy::Surface};
};

/**
 * @brief Worker pool state enumeration
 */
enum class WorkerPoolState {
    Open,
    Closed
};

/**
 * @brief Accepts jobs, numbers them and returns handles immediately
 *
 * Every submitted function must be registered (PROCPOOL_REGISTER or
 * FunctionRegistry::add) before the pool is constructed, since workers are
 * forked at construction.
 *
 * Leaving the pool's scope, like terminate(), kills the workers at once:
 * there is no draining. Join or await every handle first; a handle still
 * unresolved at that point never resolves.
 */
class WorkerPool {
public:
    /**
     * @brief Pool whose async handles resolve on the given event loop
     */
    explicit WorkerPool(
        EventLoop& loop,
        WorkerPoolConfig config = {},
        const FunctionRegistry& registry = FunctionRegistry::global()
    );

    /**
     * @brief Pool without an event loop; only submit_blocking() is available
     */
    explicit WorkerPool(
        WorkerPoolConfig config = {},
        const FunctionRegistry& registry = FunctionRegistry::global()
    );

    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Submit a job whose handle can be awaited on the pool's loop
     * @throws PoolClosedError after terminate()
     * @throws SubmissionError if fn is not registered or the pool has no loop
     * @throws SerializationError if an argument cannot be encoded
     */
    template<typename R, typename... Params, typename... Args>
    std::shared_ptr<AsyncJobHandle<R>> submit(R (*fn)(Params...), Args&&... args) {
        static_assert(sizeof...(Params) == sizeof...(Args), "wrong number of arguments");
        if (loop_ == nullptr) {
            throw SubmissionError("worker pool has no event loop, use submit_blocking");
        }

        Job job = make_job(function_name(fn), ValueList{to_value(std::forward<Args>(args))...});
        auto handle = std::make_shared<AsyncJobHandle<R>>(
            job, loop_->create_future<ResultOf<R>>(), config_.failure_policy
        );
        dispatch(std::move(job), handle);
        return handle;
    }

    /**
     * @brief Submit a job whose handle can only be joined
     * @throws PoolClosedError after terminate()
     * @throws SubmissionError if fn is not registered
     * @throws SerializationError if an argument cannot be encoded
     */
    template<typename R, typename... Params, typename... Args>
    std::shared_ptr<JobHandle<R>> submit_blocking(R (*fn)(Params...), Args&&... args) {
        static_assert(sizeof...(Params) == sizeof...(Args), "wrong number of arguments");

        Job job = make_job(function_name(fn), ValueList{to_value(std::forward<Args>(args))...});
        auto handle = std::make_shared<JobHandle<R>>(job, config_.failure_policy);
        dispatch(std::move(job), handle);
        return handle;
    }

    /**
     * @brief Kill every worker; idempotent
     */
    void terminate() noexcept;

    [[nodiscard]] WorkerPoolState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::uint32_t num_workers() const noexcept {
        return process_pool_->num_workers();
    }

    [[nodiscard]] FailurePolicy failure_policy() const noexcept {
        return config_.failure_policy;
    }

    [[nodiscard]] EventLoop* loop() const noexcept { return loop_; }

    [[nodiscard]] const ProcessPool& process_pool() const noexcept { return *process_pool_; }

    [[nodiscard]] PoolMetrics& metrics() noexcept { return metrics_; }
    [[nodiscard]] const PoolMetrics& metrics() const noexcept { return metrics_; }

    /**
     * @brief Metrics plus process pool counters as one log line
     */
    [[nodiscard]] std::string format_stats() const;

    [[nodiscard]] const WorkerPoolConfig& config() const noexcept { return config_; }

private:
    template<typename R, typename... Params>
    std::string function_name(R (*fn)(Params...)) const {
        auto name = registry_.name_of(fn);
        if (!name) {
            throw SubmissionError("function is not registered with the worker pool's registry");
        }
        return *name;
    }

    template<typename Handle>
    void dispatch(Job job, const std::shared_ptr<Handle>& handle) {
        LOG_DEBUG("submitting " + handle->to_string());
        std::shared_ptr<JobCompletion> completion = handle;
        handle->attach(apply(std::move(job), std::move(completion)));
    }

    Job make_job(std::string function, ValueList args);
    std::shared_ptr<PoolTask> apply(Job job, std::shared_ptr<JobCompletion> completion);
    JobId next_job_id() noexcept;

    WorkerPoolConfig config_;
    EventLoop* loop_{nullptr};
    const FunctionRegistry& registry_;

    std::atomic<WorkerPoolState> state_{WorkerPoolState::Open};
    std::atomic<JobId> last_job_id_{0};

    PoolMetrics metrics_;
    std::unique_ptr<ProcessPool> process_pool_;
};

} // namespace procpool
