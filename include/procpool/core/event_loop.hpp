#pragma once

/**
 * @file event_loop.hpp
 * @brief Single-threaded event loop driving coroutines and callbacks
 */

#include <atomic>
#include <chrono>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

#include "procpool/core/errors.hpp"
#include "procpool/core/logger.hpp"
#include "procpool/core/queue.hpp"
#include "procpool/core/task.hpp"

namespace procpool {

template<typename T>
class Future;

/**
 * @brief Callback queue plus timers, run on whichever thread drives it
 *
 * The loop has no thread of its own: run_forever(), run_until_complete()
 * and run_once() execute callbacks on the calling thread, which becomes
 * the loop thread for that call. Other threads hand work to it through
 * call_soon_threadsafe().
 */
class EventLoop {
public:
    using Callback = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    EventLoop() = default;
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Schedule a callback from the loop thread (or while the loop is idle)
     * @throws PreconditionError if called from another thread while the loop runs
     */
    void call_soon(Callback callback);

    /**
     * @brief Schedule a callback from any thread; never blocks
     *
     * Callbacks handed to a closed loop are dropped.
     */
    void call_soon_threadsafe(Callback callback) noexcept;

    /**
     * @brief Schedule a callback after a delay; callable from any thread
     */
    void call_later(Clock::duration delay, Callback callback);

    /**
     * @brief Run one batch: wait for the first ready callback or due timer,
     *        then run everything that is ready at that point
     * @return Number of callbacks run
     */
    std::size_t run_once();

    /**
     * @brief Run until stop() is called
     */
    void run_forever();

    /**
     * @brief Make run_forever() return after the current batch; any thread
     */
    void stop() noexcept;

    /**
     * @brief Drive the loop until the task finishes
     * @return The task's value
     * @throws Whatever the task throws
     */
    template<typename T>
    T run_until_complete(Task<T> task) {
        RunGuard guard(*this);
        auto handle = task.handle();
        call_soon([handle] { handle.resume(); });
        while (!task.done()) {
            if (is_closed()) {
                throw InvalidStateError("event loop closed before the task finished");
            }
            run_once();
        }
        return task.result();
    }

    /**
     * @brief Start a task that nobody awaits; exceptions it throws are logged
     */
    void spawn(Task<void> task);

    /**
     * @brief Future bound to this loop (defined in future.hpp)
     */
    template<typename T>
    Future<T> create_future();

    /**
     * @brief Awaitable that resumes the awaiting coroutine on this loop
     */
    auto schedule() noexcept {
        struct ScheduleAwaiter {
            EventLoop& loop;
            bool await_ready() const noexcept { return false; }
            void await_suspend(std::coroutine_handle<> handle) {
                loop.call_soon_threadsafe([handle] { handle.resume(); });
            }
            void await_resume() const noexcept {}
        };
        return ScheduleAwaiter{*this};
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_loop_thread() const noexcept {
        return loop_thread_.load(std::memory_order_acquire) == std::this_thread::get_id();
    }

    /**
     * @brief Stop accepting callbacks and drop the pending ones
     */
    void close() noexcept;

    [[nodiscard]] bool is_closed() const noexcept { return ready_.is_closed(); }

    [[nodiscard]] std::size_t pending() const { return ready_.size(); }

private:
    struct Timer {
        Clock::time_point deadline;
        std::uint64_t sequence;
        Callback callback;
    };

    struct TimerLater {
        bool operator()(const Timer& a, const Timer& b) const noexcept {
            if (a.deadline != b.deadline) {
                return a.deadline > b.deadline;
            }
            return a.sequence > b.sequence;
        }
    };

    /**
     * @brief Marks the calling thread as the loop thread for a scope; nests
     */
    class RunGuard {
    public:
        explicit RunGuard(EventLoop& loop);
        ~RunGuard();

        RunGuard(const RunGuard&) = delete;
        RunGuard& operator=(const RunGuard&) = delete;

    private:
        EventLoop& loop_;
        bool outermost_{false};
    };

    void run_callback(Callback& callback);
    std::size_t run_due_timers();
    std::optional<Clock::duration> time_to_next_timer() const;

    UnboundedQueue<Callback> ready_;

    mutable std::mutex timers_mutex_;
    std::priority_queue<Timer, std::vector<Timer>, TimerLater> timers_;
    std::uint64_t timer_sequence_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<std::thread::id> loop_thread_{};
};

} // namespace procpool
