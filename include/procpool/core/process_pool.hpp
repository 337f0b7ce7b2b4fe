#pragma once

/**
 * @file process_pool.hpp
 * @brief Pool of forked worker processes with completion callbacks
 */

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "procpool/core/job.hpp"
#include "procpool/core/queue.hpp"
#include "procpool/core/registry.hpp"

namespace procpool {

/**
 * @brief Called on the supervisor thread with the job returned by a worker
 */
using SuccessCallback = std::function<void(Job)>;

/**
 * @brief Called on the supervisor thread with a JobFailedError for
 *        pool-level failures (worker crash, undecodable result)
 */
using ErrorCallback = std::function<void(std::exception_ptr)>;

/**
 * @brief Configuration for the process pool
 */
struct ProcessPoolConfig {
    std::uint32_t num_workers{0};  // 0 = auto-detect
};

/**
 * @brief Process pool statistics
 */
struct ProcessPoolStats {
    std::uint64_t tasks_submitted{0};
    std::uint64_t tasks_completed{0};
    std::uint64_t tasks_failed{0};
    std::uint64_t workers_respawned{0};
    std::size_t tasks_queued{0};
};

/**
 * @brief Completion state of one dispatched job, observable from any thread
 *
 * Completed after the job's callback has returned. A task whose pool was
 * terminated first never completes.
 */
class PoolTask {
public:
    explicit PoolTask(JobId job_id) noexcept : job_id_(job_id) {}

    PoolTask(const PoolTask&) = delete;
    PoolTask& operator=(const PoolTask&) = delete;

    [[nodiscard]] JobId job_id() const noexcept { return job_id_; }

    [[nodiscard]] bool ready() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return done_;
    }

    /**
     * @brief Block until the task completes
     */
    void wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return done_; });
    }

    /**
     * @brief Block until the task completes or the timeout expires
     * @return true if completed
     */
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return done_; });
    }

    /**
     * @brief Wait, then return the job returned by the worker
     * @throws JobFailedError for pool-level failures
     */
    [[nodiscard]] Job get() const;

private:
    friend class ProcessPool;

    void complete(Job job);
    void fail(std::exception_ptr error);

    const JobId job_id_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool done_{false};
    std::optional<Job> job_;
    std::exception_ptr error_;
};

/**
 * @brief Fixed set of worker processes fed from an unbounded queue
 *
 * Workers are forked in the constructor and inherit the function registry
 * as it is at that moment. A supervisor thread hands queued jobs to idle
 * workers, reads results back and invokes the completion callbacks. A
 * worker that dies is replaced; the job it was running fails with
 * WorkerCrashedError.
 *
 * terminate() (and the destructor) kill every worker immediately. Queued
 * and running jobs are dropped without invoking any callback.
 */
class ProcessPool {
public:
    explicit ProcessPool(
        ProcessPoolConfig config = {},
        const FunctionRegistry& registry = FunctionRegistry::global()
    );
    ~ProcessPool();

    // Non-copyable, non-movable
    ProcessPool(const ProcessPool&) = delete;
    ProcessPool& operator=(const ProcessPool&) = delete;

    /**
     * @brief Queue a job for execution
     *
     * The job is encoded immediately, so a value that cannot be encoded
     * fails here rather than in the worker.
     *
     * @throws PoolClosedError after terminate()
     * @throws SerializationError if the job cannot be encoded
     */
    std::shared_ptr<PoolTask> apply_async(
        Job job,
        SuccessCallback on_success,
        ErrorCallback on_error
    );

    /**
     * @brief Kill all workers and stop the supervisor; idempotent
     */
    void terminate() noexcept;

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::uint32_t num_workers() const noexcept {
        return config_.num_workers;
    }

    /**
     * @brief Current worker process ids (changes when a worker is replaced)
     */
    [[nodiscard]] std::vector<pid_t> worker_pids() const;

    [[nodiscard]] ProcessPoolStats stats() const;

private:
    struct PendingTask {
        Job job;
        Blob frame;
        SuccessCallback on_success;
        ErrorCallback on_error;
        std::shared_ptr<PoolTask> task;
    };

    struct WorkerSlot {
        std::uint32_t id{0};
        pid_t pid{-1};
        int to_child{-1};
        int from_child{-1};
        std::optional<PendingTask> current;
    };

    void spawn_worker(WorkerSlot& slot);
    void supervise();
    void dispatch_pending();
    void handle_readable(WorkerSlot& slot);
    void handle_worker_exit(WorkerSlot& slot, const std::string& reason);
    void complete_task(PendingTask& task, Job job);
    void fail_task(PendingTask& task, std::exception_ptr inner);
    void reap_workers() noexcept;
    void wake() noexcept;
    void drain_wake_pipe() noexcept;

    ProcessPoolConfig config_;
    const FunctionRegistry& registry_;

    std::vector<WorkerSlot> workers_;
    UnboundedQueue<PendingTask> queue_;

    int wake_read_{-1};
    int wake_write_{-1};

    // Guards fork() and kill() against each other
    mutable std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::thread supervisor_;
    std::thread::id supervisor_id_;

    // Set when terminate() runs on the supervisor thread itself
    std::atomic<bool> reap_on_exit_{false};
    std::mutex exit_mutex_;
    std::condition_variable exit_cv_;
    bool supervisor_exited_{false};

    std::atomic<std::uint64_t> tasks_submitted_{0};
    std::atomic<std::uint64_t> tasks_completed_{0};
    std::atomic<std::uint64_t> tasks_failed_{0};
    std::atomic<std::uint64_t> workers_respawned_{0};
};

} // namespace procpool
