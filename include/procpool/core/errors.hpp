#pragma once

/**
 * @file errors.hpp
 * @brief Exception types raised by the worker pool
 */

#include <stdexcept>
#include <string>
#include <utility>

namespace procpool {

/**
 * @brief An operation was invoked on an object that is not in the required state
 *
 * Raised when a handle is used before its job was submitted, when the worker
 * entry point receives a job without stats, or when a future is touched from
 * a thread other than its event loop's.
 */
class PreconditionError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief A value could not be encoded, decoded or converted
 */
class SerializationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A job could not be handed to the pool
 */
class SubmissionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The pool was terminated and accepts no more work
 */
class PoolClosedError : public SubmissionError {
public:
    PoolClosedError() : SubmissionError("worker pool is closed") {}
};

/**
 * @brief A future was resolved twice or read before it settled
 */
class InvalidStateError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief A worker process died or closed its pipe while running a job
 */
class WorkerCrashedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Failure raised inside a worker process, rebuilt in the submitter
 *
 * Exceptions cannot cross a process boundary, so the worker sends the
 * dynamic type name and message and the submitter raises this instead.
 */
class RemoteError : public std::runtime_error {
public:
    RemoteError(std::string type_name, const std::string& message)
        : std::runtime_error(message)
        , type_name_(std::move(type_name)) {}

    /**
     * @brief Type name of the exception thrown in the worker
     */
    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

} // namespace procpool
