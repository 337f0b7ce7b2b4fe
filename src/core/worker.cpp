/**
 * @file worker.cpp
 * @brief Worker entry point and worker process loop
 */

#include "procpool/core/worker.hpp"

#include <unistd.h>

#include <exception>
#include <string>
#include <system_error>

#include "procpool/core/codec.hpp"
#include "procpool/core/errors.hpp"
#include "procpool/core/logger.hpp"

namespace procpool {

namespace {

/**
 * @brief Placeholder inner error for throwables that are not std::exception
 */
class UnknownError : public std::runtime_error {
public:
    UnknownError() : std::runtime_error("non-standard exception thrown by job") {}
};

/**
 * @brief Answer a job frame that could not be decoded, or whose result could
 *        not be sent back, so the submitter is not left waiting
 */
Blob encode_rejection(const std::string& reason) {
    Job job(0, "<undecodable>", {});
    auto inner = std::make_exception_ptr(SerializationError(reason));
    job.set_error(std::make_shared<const JobFailedError>(job, inner));
    return encode_job(job);
}

} // namespace

Job evaluate_job(Job job, const FunctionRegistry& registry) {
    if (!job.stats()) {
        throw PreconditionError("job was not properly submitted to worker pool");
    }

    try {
        job.stats()->mark_started();
        job.set_result(registry.invoke(job.function(), job.args()));
    } catch (const std::exception&) {
        job.set_error(std::make_shared<const JobFailedError>(job, std::current_exception()));
    } catch (...) {
        job.set_error(std::make_shared<const JobFailedError>(
            job, std::make_exception_ptr(UnknownError())
        ));
    }

    if (!job.stats()->finished_at()) {
        job.stats()->mark_finished();
    }
    return job;
}

void run_worker(std::uint32_t worker_id, int read_fd, int write_fd, const FunctionRegistry& registry) {
    set_thread_name("worker-" + std::to_string(worker_id) + "/pid" + std::to_string(::getpid()));
    LOG_TRACE("worker started");

    int status = 0;
    try {
        while (auto frame = read_frame(read_fd)) {
            Blob reply;
            try {
                Job job = decode_job(*frame);
                LOG_TRACE("running " + job.to_string());
                reply = encode_job(evaluate_job(std::move(job), registry));
                if (reply.size() > MAX_FRAME_SIZE) {
                    throw SerializationError(
                        "result encodes to " + std::to_string(reply.size()) +
                        " bytes, over the frame limit"
                    );
                }
            } catch (const SerializationError& e) {
                LOG_ERROR(std::string("worker rejected job frame or result: ") + e.what());
                reply = encode_rejection(e.what());
            } catch (const PreconditionError& e) {
                LOG_ERROR(std::string("worker rejected job: ") + e.what());
                reply = encode_rejection(e.what());
            }
            write_frame(write_fd, reply);
        }
    } catch (const std::system_error& e) {
        // Submitter went away mid-frame; nothing left to report to
        LOG_DEBUG(std::string("worker pipe closed: ") + e.what());
        status = 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("worker fatal error: ") + e.what());
        status = 2;
    }

    ::close(read_fd);
    ::close(write_fd);
    ::_exit(status);
}

} // namespace procpool
