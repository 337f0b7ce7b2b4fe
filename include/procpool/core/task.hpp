#pragma once

/**
 * @file task.hpp
 * @brief Lazily started coroutine returning a value
 */

#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

#include "procpool/core/errors.hpp"

namespace procpool {

template<typename T>
class Task;

namespace detail {

class TaskPromiseBase {
public:
    struct FinalAwaiter {
        bool await_ready() noexcept { return false; }

        template<typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) noexcept {
            return handle.promise().continuation_;
        }

        void await_resume() noexcept {}
    };

    std::suspend_always initial_suspend() noexcept { return {}; }
    FinalAwaiter final_suspend() noexcept { return {}; }

    void unhandled_exception() noexcept { error_ = std::current_exception(); }

    void set_continuation(std::coroutine_handle<> continuation) noexcept {
        continuation_ = continuation;
    }

protected:
    void rethrow_if_failed() const {
        if (error_) {
            std::rethrow_exception(error_);
        }
    }

    std::coroutine_handle<> continuation_ = std::noop_coroutine();
    std::exception_ptr error_;
};

template<typename T>
class TaskPromise : public TaskPromiseBase {
public:
    Task<T> get_return_object() noexcept;

    template<typename From>
        requires std::convertible_to<From, T>
    void return_value(From&& value) {
        value_.emplace(std::forward<From>(value));
    }

    T result() {
        rethrow_if_failed();
        if (!value_) {
            throw InvalidStateError("task has not finished");
        }
        return std::move(*value_);
    }

private:
    std::optional<T> value_;
};

template<>
class TaskPromise<void> : public TaskPromiseBase {
public:
    Task<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void result() { rethrow_if_failed(); }
};

} // namespace detail

/**
 * @brief Coroutine that starts when first awaited (or driven by an EventLoop)
 *
 * Awaiting a Task runs it to completion and yields its value or rethrows
 * its exception. The awaiting coroutine is resumed by symmetric transfer
 * from the task's final suspend point, on whatever thread finished it.
 *
 * @tparam T Result type (void allowed)
 */
template<typename T = void>
class [[nodiscard]] Task {
public:
    using promise_type = detail::TaskPromise<T>;
    using handle_type = std::coroutine_handle<promise_type>;

    explicit Task(handle_type handle) noexcept : handle_(handle) {}

    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, {})) {}
    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            destroy();
            handle_ = std::exchange(other.handle_, {});
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    ~Task() { destroy(); }

    [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(handle_); }
    [[nodiscard]] bool done() const noexcept { return handle_ && handle_.done(); }

    /**
     * @brief Value of a finished task
     * @throws InvalidStateError if the task has not finished
     */
    T result() {
        if (!done()) {
            throw InvalidStateError("task has not finished");
        }
        return handle_.promise().result();
    }

    /**
     * @brief Raw coroutine handle, for the event loop to resume
     */
    [[nodiscard]] handle_type handle() const noexcept { return handle_; }

    struct Awaiter {
        handle_type handle;

        bool await_ready() const noexcept { return !handle || handle.done(); }

        std::coroutine_handle<> await_suspend(std::coroutine_handle<> continuation) noexcept {
            handle.promise().set_continuation(continuation);
            return handle;
        }

        T await_resume() {
            if (!handle) {
                throw InvalidStateError("awaiting an empty task");
            }
            return handle.promise().result();
        }
    };

    Awaiter operator co_await() && noexcept { return Awaiter{handle_}; }

private:
    void destroy() noexcept {
        if (handle_) {
            handle_.destroy();
            handle_ = {};
        }
    }

    handle_type handle_;
};

namespace detail {

template<typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>(std::coroutine_handle<TaskPromise<T>>::from_promise(*this));
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>(std::coroutine_handle<TaskPromise<void>>::from_promise(*this));
}

} // namespace detail

} // namespace procpool
