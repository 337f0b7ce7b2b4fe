/**
 * @file event_loop.cpp
 * @brief Event loop implementation
 */

#include "procpool/core/event_loop.hpp"

#include <string>

namespace procpool {

namespace {

/**
 * @brief Fire-and-forget coroutine: starts eagerly, frees itself at the end
 */
struct DetachedTask {
    struct promise_type {
        DetachedTask get_return_object() noexcept { return {}; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void return_void() noexcept {}
        // Only non-std exceptions get here; same contract as std::thread
        void unhandled_exception() noexcept { std::terminate(); }
    };
};

DetachedTask run_detached(EventLoop& loop, Task<void> task) {
    co_await loop.schedule();
    try {
        co_await std::move(task);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("spawned task failed: ") + e.what());
    }
}

} // namespace

// ============================================================================
// RunGuard
// ============================================================================

EventLoop::RunGuard::RunGuard(EventLoop& loop)
    : loop_(loop)
{
    auto self = std::this_thread::get_id();
    if (loop_.loop_thread_.load(std::memory_order_acquire) == self) {
        return;  // Nested run on the loop thread
    }

    std::thread::id none{};
    if (!loop_.loop_thread_.compare_exchange_strong(none, self, std::memory_order_acq_rel)) {
        throw InvalidStateError("event loop is already running on another thread");
    }
    outermost_ = true;
    loop_.running_.store(true, std::memory_order_release);
}

EventLoop::RunGuard::~RunGuard() {
    if (outermost_) {
        loop_.running_.store(false, std::memory_order_release);
        loop_.loop_thread_.store(std::thread::id{}, std::memory_order_release);
    }
}

// ============================================================================
// EventLoop
// ============================================================================

EventLoop::~EventLoop() {
    close();
}

void EventLoop::call_soon(Callback callback) {
    if (is_running() && !is_loop_thread()) {
        throw PreconditionError("call_soon used off the loop thread, use call_soon_threadsafe");
    }
    if (!ready_.push(std::move(callback))) {
        LOG_DEBUG("event loop closed, callback dropped");
    }
}

void EventLoop::call_soon_threadsafe(Callback callback) noexcept {
    if (!ready_.push(std::move(callback))) {
        LOG_DEBUG("event loop closed, callback dropped");
    }
}

void EventLoop::call_later(Clock::duration delay, Callback callback) {
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        timers_.push(Timer{Clock::now() + delay, timer_sequence_++, std::move(callback)});
    }
    if (!is_loop_thread()) {
        // Wake a loop blocked without a deadline
        call_soon_threadsafe(Callback{});
    }
}

std::size_t EventLoop::run_once() {
    RunGuard guard(*this);

    std::optional<Callback> first;
    auto wait = time_to_next_timer();
    if (!wait) {
        first = ready_.pop();
    } else if (*wait > Clock::duration::zero()) {
        first = ready_.pop_for(*wait);
    } else {
        first = ready_.try_pop();
    }

    std::size_t ran = 0;
    if (first) {
        run_callback(*first);
        ++ran;
    }

    ran += run_due_timers();

    // Callbacks scheduled by this batch run in the next one
    for (auto remaining = ready_.size(); remaining > 0; --remaining) {
        auto callback = ready_.try_pop();
        if (!callback) {
            break;
        }
        run_callback(*callback);
        ++ran;
    }

    return ran;
}

void EventLoop::run_forever() {
    RunGuard guard(*this);
    while (!stopping_.load(std::memory_order_acquire) && !is_closed()) {
        run_once();
    }
    stopping_.store(false, std::memory_order_release);
}

void EventLoop::stop() noexcept {
    stopping_.store(true, std::memory_order_release);
    call_soon_threadsafe(Callback{});
}

void EventLoop::spawn(Task<void> task) {
    run_detached(*this, std::move(task));
}

void EventLoop::close() noexcept {
    ready_.close();
    auto dropped = ready_.clear();
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        dropped += timers_.size();
        timers_ = {};
    }
    if (dropped > 0) {
        LOG_DEBUG("event loop closed with " + std::to_string(dropped) + " pending callbacks");
    }
}

void EventLoop::run_callback(Callback& callback) {
    if (!callback) {
        return;  // Wake-up marker
    }
    try {
        callback();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("event loop callback threw: ") + e.what());
    }
}

std::size_t EventLoop::run_due_timers() {
    std::vector<Callback> due;
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        auto now = Clock::now();
        while (!timers_.empty() && timers_.top().deadline <= now) {
            due.push_back(std::move(const_cast<Timer&>(timers_.top()).callback));
            timers_.pop();
        }
    }

    for (auto& callback : due) {
        run_callback(callback);
    }
    return due.size();
}

std::optional<EventLoop::Clock::duration> EventLoop::time_to_next_timer() const {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    if (timers_.empty()) {
        return std::nullopt;
    }
    auto wait = timers_.top().deadline - Clock::now();
    return wait > Clock::duration::zero() ? wait : Clock::duration::zero();
}

} // namespace procpool
