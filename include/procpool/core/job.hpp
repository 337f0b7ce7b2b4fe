#pragma once

/**
 * @file job.hpp
 * @brief Job data model: identity, callable reference, arguments and outcome
 */

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "procpool/core/value.hpp"

namespace procpool {

/**
 * @brief Pool-scoped job identifier, assigned in submission order
 */
using JobId = std::uint64_t;

/**
 * @brief Timing of one unit of work
 *
 * submitted_at is fixed at construction. started_at and finished_at are each
 * set at most once, start before finish.
 */
class JobStats {
public:
    explicit JobStats(Timestamp submitted_at = std::chrono::steady_clock::now()) noexcept
        : submitted_at_(submitted_at) {}

    /**
     * @brief Rebuild stats decoded from a worker message
     */
    static JobStats restore(
        Timestamp submitted_at,
        std::optional<Timestamp> started_at,
        std::optional<Timestamp> finished_at
    );

    /**
     * @brief Record the start of execution
     * @throws PreconditionError if already started
     */
    void mark_started(Timestamp at = std::chrono::steady_clock::now());

    /**
     * @brief Record the end of execution
     * @throws PreconditionError if not started, already finished, or at < started_at
     */
    void mark_finished(Timestamp at = std::chrono::steady_clock::now());

    [[nodiscard]] Timestamp submitted_at() const noexcept { return submitted_at_; }
    [[nodiscard]] const std::optional<Timestamp>& started_at() const noexcept { return started_at_; }
    [[nodiscard]] const std::optional<Timestamp>& finished_at() const noexcept { return finished_at_; }

    /**
     * @brief finished_at - started_at, or zero while either is unset
     */
    [[nodiscard]] std::chrono::nanoseconds elapsed() const noexcept;

    [[nodiscard]] double elapsed_seconds() const noexcept {
        return std::chrono::duration<double>(elapsed()).count();
    }

private:
    Timestamp submitted_at_;
    std::optional<Timestamp> started_at_;
    std::optional<Timestamp> finished_at_;
};

class JobFailedError;

/**
 * @brief One unit of dispatched work
 *
 * A Job is a value. It crosses into a worker as an encoded copy and comes
 * back as a second, independently mutated copy; the object the submitter
 * keeps never observes the worker's changes.
 */
class Job {
public:
    Job() = default;

    Job(JobId id, std::string function, ValueList args)
        : id_(id)
        , function_(std::move(function))
        , args_(std::move(args)) {}

    [[nodiscard]] JobId id() const noexcept { return id_; }

    /**
     * @brief Registered name of the callable
     */
    [[nodiscard]] const std::string& function() const noexcept { return function_; }

    /**
     * @brief Display name for logging
     */
    [[nodiscard]] const std::string& name() const noexcept { return function_; }

    [[nodiscard]] const ValueList& args() const noexcept { return args_; }

    [[nodiscard]] const std::optional<JobStats>& stats() const noexcept { return stats_; }
    [[nodiscard]] std::optional<JobStats>& stats() noexcept { return stats_; }
    void set_stats(JobStats stats) noexcept { stats_ = stats; }

    [[nodiscard]] const std::optional<Value>& result() const noexcept { return result_; }
    void set_result(Value value) { result_ = std::move(value); }

    [[nodiscard]] const std::shared_ptr<const JobFailedError>& error() const noexcept { return error_; }
    void set_error(std::shared_ptr<const JobFailedError> error) noexcept { error_ = std::move(error); }
    [[nodiscard]] bool failed() const noexcept { return error_ != nullptr; }

    /**
     * @brief "Job <id> - <name>"
     */
    [[nodiscard]] std::string to_string() const;

private:
    JobId id_{0};
    std::string function_;
    ValueList args_;
    std::optional<JobStats> stats_;
    std::optional<Value> result_;
    std::shared_ptr<const JobFailedError> error_;
};

/**
 * @brief A failure together with the job that produced it
 *
 * inner_error is the original failure: the user function's exception
 * (rebuilt as RemoteError on the submitting side) or a pool-level error
 * such as WorkerCrashedError.
 */
class JobFailedError : public std::runtime_error {
public:
    JobFailedError(Job job, std::exception_ptr inner_error);

    [[nodiscard]] const Job& job() const noexcept { return job_; }
    [[nodiscard]] const std::exception_ptr& inner_error() const noexcept { return inner_error_; }

    [[noreturn]] void rethrow_inner() const;

private:
    Job job_;
    std::exception_ptr inner_error_;
};

/**
 * @brief Type name and message of an exception, for logs and the wire
 */
struct ErrorDescription {
    std::string type_name;
    std::string message;
};

[[nodiscard]] ErrorDescription describe_exception(const std::exception_ptr& error);

/**
 * @brief Encode a job, including its outcome, into a frame payload
 * @throws SerializationError if a field cannot be encoded
 */
[[nodiscard]] Blob encode_job(const Job& job);

/**
 * @brief Decode a frame payload produced by encode_job
 *
 * A recorded failure comes back as a JobFailedError whose inner error is a
 * RemoteError carrying the original type name and message.
 * @throws SerializationError on malformed input
 */
[[nodiscard]] Job decode_job(const Blob& payload);

} // namespace procpool
