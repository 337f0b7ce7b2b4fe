#pragma once

/**
 * @file worker.hpp
 * @brief Code that runs inside worker processes
 */

#include <cstdint>

#include "procpool/core/job.hpp"
#include "procpool/core/registry.hpp"

namespace procpool {

/**
 * @brief Execute one job and record its outcome on the job itself
 *
 * Records started_at, runs the job's function with its arguments and stores
 * the return value in result. A thrown exception is wrapped in a
 * JobFailedError and stored in error; it is not rethrown. finished_at is
 * always recorded and the (possibly failed) job is returned.
 *
 * @throws PreconditionError if the job has no stats, i.e. was never submitted
 */
Job evaluate_job(Job job, const FunctionRegistry& registry = FunctionRegistry::global());

/**
 * @brief Worker process main loop
 *
 * Reads job frames from read_fd, evaluates them and writes the resulting
 * jobs to write_fd until the submitter closes its end. Never returns: the
 * process leaves through _exit() so no parent state is torn down twice.
 */
[[noreturn]] void run_worker(
    std::uint32_t worker_id,
    int read_fd,
    int write_fd,
    const FunctionRegistry& registry
);

} // namespace procpool
