#pragma once

/**
 * @file handle.hpp
 * @brief Submitter-side observers of a job: blocking and awaitable flavors
 */

#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "procpool/core/errors.hpp"
#include "procpool/core/event_loop.hpp"
#include "procpool/core/future.hpp"
#include "procpool/core/job.hpp"
#include "procpool/core/logger.hpp"
#include "procpool/core/process_pool.hpp"

namespace procpool {

/**
 * @brief How a failure raised by the job's own function reaches the submitter
 */
enum class FailurePolicy {
    Absorb,   // Resolves with a value-initialized result; failure only on job().error()
    Surface   // join() throws JobFailedError, await throws the inner error
};

/**
 * @brief Result type delivered by a handle for a function returning R
 */
template<typename R>
using ResultOf = std::conditional_t<std::is_void_v<R>, std::monostate, R>;

/**
 * @brief Receiver of a job's outcome, invoked by the pool's completion thread
 */
class JobCompletion {
public:
    virtual ~JobCompletion() = default;

    /**
     * @brief The worker returned the job (possibly carrying a recorded error)
     */
    virtual void on_success(Job job) = 0;

    /**
     * @brief The pool failed the job
     * @throws std::invalid_argument if error is not a JobFailedError
     */
    virtual void on_failure(std::exception_ptr error) = 0;
};

namespace detail {

/**
 * @brief Copy of the JobFailedError held by error
 * @throws std::invalid_argument for any other error type
 */
inline JobFailedError expect_job_failure(const std::exception_ptr& error) {
    if (!error) {
        throw std::invalid_argument("unexpected error type: none");
    }
    try {
        std::rethrow_exception(error);
    } catch (const JobFailedError& failure) {
        return failure;
    } catch (const std::exception& other) {
        throw std::invalid_argument(std::string("unexpected error type: ") + other.what());
    } catch (...) {
        throw std::invalid_argument("unexpected error type: not a std::exception");
    }
}

inline std::string format_seconds(double seconds) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2fs", seconds);
    return buffer;
}

} // namespace detail

/**
 * @brief Blocking handle to a submitted job
 *
 * Holds the submitter's copy of the job until the completion thread swaps
 * in the copy returned by the worker. join() waits on the pool task.
 *
 * @tparam R Return type of the job's function
 */
template<typename R>
class JobHandle final : public JobCompletion {
public:
    using result_type = ResultOf<R>;

    explicit JobHandle(Job job, FailurePolicy policy = FailurePolicy::Surface)
        : job_(std::move(job))
        , job_id_(job_.id())
        , policy_(policy) {}

    JobHandle(const JobHandle&) = delete;
    JobHandle& operator=(const JobHandle&) = delete;

    [[nodiscard]] JobId job_id() const noexcept { return job_id_; }

    [[nodiscard]] FailurePolicy failure_policy() const noexcept { return policy_; }

    /**
     * @throws PreconditionError if the job was never submitted
     */
    [[nodiscard]] JobStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!job_.stats()) {
            throw PreconditionError("job was not properly submitted to worker pool");
        }
        return *job_.stats();
    }

    /**
     * @brief Snapshot of the handle's current job
     */
    [[nodiscard]] Job job() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return job_;
    }

    /**
     * @brief Wire the pool task that will deliver the outcome
     */
    void attach(std::shared_ptr<PoolTask> task) {
        std::lock_guard<std::mutex> lock(mutex_);
        task_ = std::move(task);
    }

    [[nodiscard]] bool done() const {
        auto task = pool_task();
        return task && task->ready();
    }

    /**
     * @brief Block until the job completes
     * @return The function's return value
     * @throws PreconditionError if the job was never submitted
     * @throws JobFailedError for pool-level failures, and for function
     *         failures under FailurePolicy::Surface
     */
    result_type join() const {
        auto task = pool_task();
        if (!task) {
            throw PreconditionError("job was not properly submitted to worker pool");
        }
        return resolve(task->get(), policy_);
    }

    /**
     * @brief As join(), giving up after a timeout
     * @return nullopt if the job has not completed in time
     */
    template<typename Rep, typename Period>
    std::optional<result_type> join_for(std::chrono::duration<Rep, Period> timeout) const {
        auto task = pool_task();
        if (!task) {
            throw PreconditionError("job was not properly submitted to worker pool");
        }
        if (!task->wait_for(timeout)) {
            return std::nullopt;
        }
        return resolve(task->get(), policy_);
    }

    void on_success(Job job) override {
        std::lock_guard<std::mutex> lock(mutex_);
        job_ = std::move(job);
        LOG_DEBUG(describe() + " finished in " + detail::format_seconds(elapsed_seconds()));
    }

    void on_failure(std::exception_ptr error) override {
        auto failure = detail::expect_job_failure(error);
        std::lock_guard<std::mutex> lock(mutex_);
        job_ = failure.job();
        LOG_DEBUG(describe() + " failed in " + detail::format_seconds(elapsed_seconds()));
    }

    /**
     * @brief "(Handle) Job <id> - <name>"
     */
    [[nodiscard]] std::string to_string() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return describe();
    }

    /**
     * @brief Value the handle delivers for a job returned by a worker
     */
    static result_type resolve(const Job& job, FailurePolicy policy) {
        if (job.error()) {
            if (policy == FailurePolicy::Surface) {
                throw JobFailedError(*job.error());
            }
            return result_type{};
        }
        if (!job.result()) {
            return result_type{};
        }
        return from_value<result_type>(*job.result());
    }

private:
    // Caller holds mutex_
    std::string describe() const { return "(Handle) " + job_.to_string(); }

    // Caller holds mutex_
    double elapsed_seconds() const noexcept {
        return job_.stats() ? job_.stats()->elapsed_seconds() : 0.0;
    }

    std::shared_ptr<PoolTask> pool_task() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return task_;
    }

    mutable std::mutex mutex_;
    Job job_;
    const JobId job_id_;
    const FailurePolicy policy_;
    std::shared_ptr<PoolTask> task_;
};

/**
 * @brief Handle that a coroutine on an EventLoop can co_await
 *
 * Completion callbacks arrive on the pool's supervisor thread and are
 * forwarded to the loop with call_soon_threadsafe(); the future is only
 * ever touched on the loop thread. Must be owned by a std::shared_ptr.
 *
 * @tparam R Return type of the job's function
 */
template<typename R>
class AsyncJobHandle final
    : public JobCompletion
    , public std::enable_shared_from_this<AsyncJobHandle<R>> {
public:
    using result_type = ResultOf<R>;

    AsyncJobHandle(Job job, Future<result_type> future, FailurePolicy policy = FailurePolicy::Surface)
        : handle_(std::move(job), policy)
        , future_(std::move(future)) {}

    [[nodiscard]] JobId job_id() const noexcept { return handle_.job_id(); }
    [[nodiscard]] JobStats stats() const { return handle_.stats(); }
    [[nodiscard]] Job job() const { return handle_.job(); }
    [[nodiscard]] bool done() const { return handle_.done(); }

    void attach(std::shared_ptr<PoolTask> task) { handle_.attach(std::move(task)); }

    /**
     * @brief Block the calling thread; never call from the loop thread
     */
    result_type join() const { return handle_.join(); }

    template<typename Rep, typename Period>
    std::optional<result_type> join_for(std::chrono::duration<Rep, Period> timeout) const {
        return handle_.join_for(timeout);
    }

    [[nodiscard]] const Future<result_type>& future() const noexcept { return future_; }

    void on_success(Job job) override {
        auto self = this->shared_from_this();
        future_.loop().call_soon_threadsafe([self, job = std::move(job)]() mutable {
            self->settle_success(std::move(job));
        });
    }

    void on_failure(std::exception_ptr error) override {
        auto failure = detail::expect_job_failure(error);
        auto self = this->shared_from_this();
        future_.loop().call_soon_threadsafe([self, error = std::move(error), inner = failure.inner_error()] {
            self->handle_.on_failure(error);
            self->future_.set_exception(inner);
        });
    }

    [[nodiscard]] std::string to_string() const { return handle_.to_string(); }

    auto operator co_await() const noexcept { return future_.operator co_await(); }

private:
    // Runs on the loop thread
    void settle_success(Job job) {
        handle_.on_success(job);
        if (job.error() && handle_.failure_policy() == FailurePolicy::Surface) {
            future_.set_exception(job.error()->inner_error());
            return;
        }
        try {
            future_.set_result(JobHandle<R>::resolve(job, handle_.failure_policy()));
        } catch (const SerializationError&) {
            future_.set_exception(std::current_exception());
        }
    }

    JobHandle<R> handle_;
    Future<result_type> future_;
};

} // namespace procpool
