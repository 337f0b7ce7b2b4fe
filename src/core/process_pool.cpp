/**
 * @file process_pool.cpp
 * @brief Process pool implementation
 */

#include "procpool/core/process_pool.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>

#include "procpool/core/codec.hpp"
#include "procpool/core/errors.hpp"
#include "procpool/core/logger.hpp"
#include "procpool/core/worker.hpp"

namespace procpool {

namespace {

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void make_pipe(int fds[2], int flags) {
    if (::pipe2(fds, flags) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
}

/**
 * @brief In a freshly forked child, close every descriptor except stdio
 *        and the two pipe ends the worker owns
 */
void close_inherited_fds(int keep_a, int keep_b) noexcept {
    DIR* dir = ::opendir("/proc/self/fd");
    if (dir == nullptr) {
        return;  // Best effort: sibling pipe ends stay open
    }

    int own = ::dirfd(dir);
    std::vector<int> to_close;
    while (dirent* entry = ::readdir(dir)) {
        char* end = nullptr;
        long fd = std::strtol(entry->d_name, &end, 10);
        if (end == entry->d_name || *end != '\0') {
            continue;
        }
        if (fd <= STDERR_FILENO || fd == own || fd == keep_a || fd == keep_b) {
            continue;
        }
        to_close.push_back(static_cast<int>(fd));
    }
    ::closedir(dir);

    for (int fd : to_close) {
        ::close(fd);
    }
}

std::string describe_exit(int status) {
    if (WIFEXITED(status)) {
        return "exited with status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "stopped unexpectedly";
}

pid_t wait_for_child(pid_t pid, int& status) noexcept {
    pid_t rc;
    do {
        rc = ::waitpid(pid, &status, 0);
    } while (rc < 0 && errno == EINTR);
    return rc;
}

} // namespace

// ============================================================================
// PoolTask
// ============================================================================

Job PoolTask::get() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return done_; });
    if (error_) {
        std::rethrow_exception(error_);
    }
    return *job_;
}

void PoolTask::complete(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job_ = std::move(job);
        done_ = true;
    }
    cv_.notify_all();
}

void PoolTask::fail(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = std::move(error);
        done_ = true;
    }
    cv_.notify_all();
}

// ============================================================================
// ProcessPool
// ============================================================================

ProcessPool::ProcessPool(ProcessPoolConfig config, const FunctionRegistry& registry)
    : config_(config)
    , registry_(registry)
{
    if (config_.num_workers == 0) {
        config_.num_workers = std::thread::hardware_concurrency();
        if (config_.num_workers == 0) {
            config_.num_workers = 4;  // Fallback
        }
    }

    int wake[2];
    make_pipe(wake, O_CLOEXEC | O_NONBLOCK);
    wake_read_ = wake[0];
    wake_write_ = wake[1];

    workers_.resize(config_.num_workers);
    for (std::uint32_t i = 0; i < config_.num_workers; ++i) {
        workers_[i].id = i;
    }

    running_.store(true, std::memory_order_release);
    try {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        for (auto& slot : workers_) {
            spawn_worker(slot);
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("failed to start worker processes: ") + e.what());
        terminate();
        close_fd(wake_read_);
        close_fd(wake_write_);
        throw;
    }

    supervisor_ = std::thread(&ProcessPool::supervise, this);
    supervisor_id_ = supervisor_.get_id();
    LOG_DEBUG("process pool started with " + std::to_string(config_.num_workers) + " workers");
}

ProcessPool::~ProcessPool() {
    terminate();

    if (reap_on_exit_.load(std::memory_order_acquire) &&
        std::this_thread::get_id() != supervisor_id_) {
        std::unique_lock<std::mutex> lock(exit_mutex_);
        exit_cv_.wait(lock, [this] { return supervisor_exited_; });
    }

    close_fd(wake_read_);
    close_fd(wake_write_);
}

std::shared_ptr<PoolTask> ProcessPool::apply_async(
    Job job,
    SuccessCallback on_success,
    ErrorCallback on_error
) {
    if (!is_running()) {
        throw PoolClosedError();
    }

    auto task = std::make_shared<PoolTask>(job.id());
    Blob frame = encode_job(job);
    if (frame.size() > MAX_FRAME_SIZE) {
        throw SerializationError(
            job.to_string() + " encodes to " + std::to_string(frame.size()) +
            " bytes, over the frame limit"
        );
    }
    PendingTask pending{std::move(job), std::move(frame), std::move(on_success), std::move(on_error), task};

    if (!queue_.push(std::move(pending))) {
        throw PoolClosedError();
    }
    tasks_submitted_.fetch_add(1, std::memory_order_relaxed);
    wake();
    return task;
}

void ProcessPool::terminate() noexcept {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        for (auto& slot : workers_) {
            if (slot.pid > 0) {
                ::kill(slot.pid, SIGKILL);
            }
        }
    }

    queue_.close();
    auto dropped = queue_.clear();
    wake();

    if (supervisor_.joinable()) {
        if (supervisor_.get_id() == std::this_thread::get_id()) {
            // Called from a completion callback; the supervisor reaps on its way out
            reap_on_exit_.store(true, std::memory_order_release);
            supervisor_.detach();
            LOG_DEBUG("process pool terminating from supervisor thread");
            return;
        }
        supervisor_.join();
    }

    reap_workers();
    LOG_DEBUG("process pool terminated, " + std::to_string(dropped) + " queued jobs dropped");
}

std::vector<pid_t> ProcessPool::worker_pids() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    std::vector<pid_t> pids;
    pids.reserve(workers_.size());
    for (const auto& slot : workers_) {
        if (slot.pid > 0) {
            pids.push_back(slot.pid);
        }
    }
    return pids;
}

ProcessPoolStats ProcessPool::stats() const {
    ProcessPoolStats result;
    result.tasks_submitted = tasks_submitted_.load(std::memory_order_relaxed);
    result.tasks_completed = tasks_completed_.load(std::memory_order_relaxed);
    result.tasks_failed = tasks_failed_.load(std::memory_order_relaxed);
    result.workers_respawned = workers_respawned_.load(std::memory_order_relaxed);
    result.tasks_queued = queue_.size();
    return result;
}

// Caller holds lifecycle_mutex_
void ProcessPool::spawn_worker(WorkerSlot& slot) {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    int to_child[2];
    int from_child[2];
    make_pipe(to_child, O_CLOEXEC);
    try {
        make_pipe(from_child, O_CLOEXEC);
    } catch (const std::system_error&) {
        ::close(to_child[0]);
        ::close(to_child[1]);
        throw;
    }

    auto registry_lock = registry_.lock_for_fork();
    pid_t pid = ::fork();

    if (pid == 0) {
        registry_lock.unlock();
        ::close(to_child[1]);
        ::close(from_child[0]);
        close_inherited_fds(to_child[0], from_child[1]);
        run_worker(slot.id, to_child[0], from_child[1], registry_);
    }

    registry_lock.unlock();
    ::close(to_child[0]);
    ::close(from_child[1]);

    if (pid < 0) {
        int err = errno;
        ::close(to_child[1]);
        ::close(from_child[0]);
        throw std::system_error(err, std::generic_category(), "fork");
    }

    slot.pid = pid;
    slot.to_child = to_child[1];
    slot.from_child = from_child[0];
    LOG_TRACE("spawned worker " + std::to_string(slot.id) + " as pid " + std::to_string(pid));
}

void ProcessPool::supervise() {
    set_thread_name("pool-supervisor");

    // A worker dying between poll() and write() must surface as EPIPE
    sigset_t blocked;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &blocked, nullptr);

    std::vector<pollfd> fds;
    std::vector<std::size_t> slot_of;

    while (is_running()) {
        dispatch_pending();

        fds.clear();
        slot_of.clear();
        fds.push_back(pollfd{wake_read_, POLLIN, 0});
        for (std::size_t i = 0; i < workers_.size(); ++i) {
            if (workers_[i].from_child >= 0) {
                fds.push_back(pollfd{workers_[i].from_child, POLLIN, 0});
                slot_of.push_back(i);
            }
        }

        int rc = ::poll(fds.data(), fds.size(), -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(std::string("supervisor poll failed: ") + std::strerror(errno));
            break;
        }

        if (fds[0].revents != 0) {
            drain_wake_pipe();
        }

        for (std::size_t i = 1; i < fds.size() && is_running(); ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                handle_readable(workers_[slot_of[i - 1]]);
            }
        }
    }

    if (is_running()) {
        // Left the loop on an unrecoverable error
        terminate();
    }

    clear_thread_name();

    if (reap_on_exit_.load(std::memory_order_acquire)) {
        reap_workers();
        {
            std::lock_guard<std::mutex> lock(exit_mutex_);
            supervisor_exited_ = true;
        }
        exit_cv_.notify_all();
    }
}

void ProcessPool::dispatch_pending() {
    for (auto& slot : workers_) {
        while (slot.pid > 0 && !slot.current) {
            auto pending = queue_.try_pop();
            if (!pending) {
                return;
            }

            slot.current = std::move(*pending);
            try {
                write_frame(slot.to_child, slot.current->frame);
                LOG_TRACE("dispatched " + slot.current->job.to_string() +
                          " to worker " + std::to_string(slot.id));
            } catch (const SerializationError&) {
                // Nothing was written, the worker stays idle
                PendingTask task = std::move(*slot.current);
                slot.current.reset();
                fail_task(task, std::current_exception());
            } catch (const std::system_error& e) {
                handle_worker_exit(slot, std::string("write failed: ") + e.what());
            }
        }
    }
}

void ProcessPool::handle_readable(WorkerSlot& slot) {
    std::optional<Blob> frame;
    std::string reason = "closed its pipe";
    try {
        frame = read_frame(slot.from_child);
    } catch (const std::exception& e) {
        reason = std::string("sent a broken frame: ") + e.what();
    }

    if (!frame) {
        handle_worker_exit(slot, reason);
        return;
    }

    if (!slot.current) {
        LOG_WARN("worker " + std::to_string(slot.id) + " answered while idle, frame dropped");
        return;
    }

    PendingTask task = std::move(*slot.current);
    slot.current.reset();

    std::optional<Job> done;
    try {
        done = decode_job(*frame);
    } catch (const SerializationError&) {
        fail_task(task, std::current_exception());
        return;
    }

    if (done->id() != task.job.id()) {
        // The worker could not decode what it was sent and answered with a rejection
        std::exception_ptr inner = done->error()
            ? done->error()->inner_error()
            : std::make_exception_ptr(SerializationError(
                  "worker answered job " + std::to_string(done->id()) +
                  " for job " + std::to_string(task.job.id())));
        fail_task(task, inner);
        return;
    }

    complete_task(task, std::move(*done));
}

void ProcessPool::handle_worker_exit(WorkerSlot& slot, const std::string& reason) {
    close_fd(slot.to_child);
    close_fd(slot.from_child);

    int status = 0;
    std::string how = reason;
    if (slot.pid > 0 && wait_for_child(slot.pid, status) == slot.pid) {
        how = describe_exit(status);
    }
    pid_t dead = slot.pid;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        slot.pid = -1;
    }

    if (!is_running()) {
        return;
    }

    LOG_WARN("worker " + std::to_string(slot.id) + " (pid " + std::to_string(dead) + ") " + how);

    if (slot.current) {
        PendingTask task = std::move(*slot.current);
        slot.current.reset();
        fail_task(task, std::make_exception_ptr(WorkerCrashedError(
            "worker pid " + std::to_string(dead) + " " + how + " while running " + task.job.to_string()
        )));
    }

    try {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        spawn_worker(slot);
        if (slot.pid > 0) {
            workers_respawned_.fetch_add(1, std::memory_order_relaxed);
        }
    } catch (const std::system_error& e) {
        LOG_ERROR("could not replace worker " + std::to_string(slot.id) + ": " + e.what());
    }
}

void ProcessPool::complete_task(PendingTask& task, Job job) {
    tasks_completed_.fetch_add(1, std::memory_order_relaxed);
    try {
        if (task.on_success) {
            task.on_success(job);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("success callback for " + task.job.to_string() + " threw: " + e.what());
    }
    task.task->complete(std::move(job));
}

void ProcessPool::fail_task(PendingTask& task, std::exception_ptr inner) {
    tasks_failed_.fetch_add(1, std::memory_order_relaxed);
    auto error = std::make_exception_ptr(JobFailedError(task.job, std::move(inner)));
    try {
        if (task.on_error) {
            task.on_error(error);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("error callback for " + task.job.to_string() + " threw: " + e.what());
    }
    task.task->fail(std::move(error));
}

void ProcessPool::reap_workers() noexcept {
    for (auto& slot : workers_) {
        if (slot.pid > 0) {
            int status = 0;
            wait_for_child(slot.pid, status);
            slot.pid = -1;
        }
        close_fd(slot.to_child);
        close_fd(slot.from_child);
        slot.current.reset();
    }
}

void ProcessPool::wake() noexcept {
    if (wake_write_ < 0) {
        return;
    }
    const char byte = 1;
    ssize_t rc;
    do {
        rc = ::write(wake_write_, &byte, 1);
    } while (rc < 0 && errno == EINTR);
    // EAGAIN: pipe already full, the supervisor is awake anyway
}

void ProcessPool::drain_wake_pipe() noexcept {
    char buffer[64];
    while (::read(wake_read_, buffer, sizeof(buffer)) > 0) {
    }
}

} // namespace procpool
