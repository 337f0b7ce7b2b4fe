#pragma once

/**
 * @file future.hpp
 * @brief Single-assignment result bound to an event loop
 */

#include <chrono>
#include <coroutine>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "procpool/core/errors.hpp"
#include "procpool/core/event_loop.hpp"
#include "procpool/core/task.hpp"

namespace procpool {

/**
 * @brief Result slot that coroutines on one EventLoop can await
 *
 * Copies share state. All mutation happens on the loop thread: set_result()
 * and set_exception() throw PreconditionError when called from another
 * thread while the loop runs. Awaiting coroutines and done callbacks are
 * resumed through call_soon(), never inline from the setter.
 *
 * @tparam T Value type (use std::monostate for "no value")
 */
template<typename T>
class Future {
    static_assert(!std::is_void_v<T>, "use Future<std::monostate> for valueless futures");
    static_assert(!std::is_reference_v<T>, "Future cannot hold a reference");

    struct State {
        explicit State(EventLoop& l) : loop(l) {}

        EventLoop& loop;
        bool done{false};
        std::optional<T> value;
        std::exception_ptr error;
        std::vector<std::coroutine_handle<>> waiters;
        std::vector<std::function<void()>> callbacks;
    };

public:
    explicit Future(EventLoop& loop)
        : state_(std::make_shared<State>(loop)) {}

    [[nodiscard]] EventLoop& loop() const noexcept { return state_->loop; }

    [[nodiscard]] bool done() const noexcept { return state_->done; }

    /**
     * @brief Resolve the future
     * @throws PreconditionError off the loop thread
     * @throws InvalidStateError if already resolved or rejected
     */
    void set_result(T value) {
        check_settable();
        state_->value.emplace(std::move(value));
        settle();
    }

    /**
     * @brief Reject the future
     * @throws PreconditionError off the loop thread
     * @throws InvalidStateError if already resolved or rejected
     */
    void set_exception(std::exception_ptr error) {
        check_settable();
        state_->error = std::move(error);
        settle();
    }

    /**
     * @brief Value of a settled future
     * @throws InvalidStateError if not settled yet; the stored error if rejected
     */
    [[nodiscard]] T result() const {
        if (!state_->done) {
            throw InvalidStateError("future is not done");
        }
        if (state_->error) {
            std::rethrow_exception(state_->error);
        }
        return *state_->value;
    }

    [[nodiscard]] std::exception_ptr exception() const {
        if (!state_->done) {
            throw InvalidStateError("future is not done");
        }
        return state_->error;
    }

    /**
     * @brief Run a callback on the loop once the future settles
     */
    void add_done_callback(std::function<void()> callback) {
        if (state_->done) {
            state_->loop.call_soon(std::move(callback));
        } else {
            state_->callbacks.push_back(std::move(callback));
        }
    }

    struct Awaiter {
        std::shared_ptr<State> state;

        bool await_ready() const noexcept { return state->done; }

        void await_suspend(std::coroutine_handle<> handle) {
            state->waiters.push_back(handle);
        }

        T await_resume() {
            if (state->error) {
                std::rethrow_exception(state->error);
            }
            return *state->value;
        }
    };

    Awaiter operator co_await() const noexcept { return Awaiter{state_}; }

private:
    void check_settable() const {
        if (state_->loop.is_running() && !state_->loop.is_loop_thread()) {
            throw PreconditionError("future settled off its event loop thread");
        }
        if (state_->done) {
            throw InvalidStateError("future already settled");
        }
    }

    void settle() {
        state_->done = true;
        for (auto handle : std::exchange(state_->waiters, {})) {
            state_->loop.call_soon([handle] { handle.resume(); });
        }
        for (auto& callback : std::exchange(state_->callbacks, {})) {
            state_->loop.call_soon(std::move(callback));
        }
    }

    std::shared_ptr<State> state_;
};

template<typename T>
Future<T> EventLoop::create_future() {
    return Future<T>(*this);
}

/**
 * @brief Suspend the calling coroutine for a duration without blocking the loop
 */
inline Task<void> sleep(EventLoop& loop, EventLoop::Clock::duration duration) {
    Future<std::monostate> done(loop);
    loop.call_later(duration, [done]() mutable { done.set_result(std::monostate{}); });
    co_await done;
}

} // namespace procpool
