/**
 * @file job.cpp
 * @brief Job model and wire encoding
 */

#include "procpool/core/job.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <typeinfo>

#include "procpool/core/codec.hpp"
#include "procpool/core/errors.hpp"

namespace procpool {

namespace {

constexpr std::uint8_t JOB_MESSAGE_VERSION = 1;

std::string demangle(const char* name) {
    int status = 0;
    char* demangled = abi::__cxa_demangle(name, nullptr, nullptr, &status);
    if (status != 0 || demangled == nullptr) {
        return name;
    }
    std::string result(demangled);
    std::free(demangled);
    return result;
}

std::int64_t to_ticks(Timestamp at) noexcept {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(at.time_since_epoch()).count();
}

Timestamp from_ticks(std::int64_t ticks) noexcept {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::nanoseconds(ticks)));
}

void put_optional_timestamp(Encoder& enc, const std::optional<Timestamp>& at) {
    enc.put_u8(at ? 1 : 0);
    if (at) {
        enc.put_i64(to_ticks(*at));
    }
}

std::optional<Timestamp> get_optional_timestamp(Decoder& dec) {
    if (dec.get_u8() == 0) {
        return std::nullopt;
    }
    return from_ticks(dec.get_i64());
}

std::string failure_message(const Job& job, const std::exception_ptr& inner) {
    auto description = describe_exception(inner);
    return job.to_string() + " failed: " + description.type_name + ": " + description.message;
}

} // namespace

// ---------------------------------------------------------------------------
// JobStats
// ---------------------------------------------------------------------------

JobStats JobStats::restore(
    Timestamp submitted_at,
    std::optional<Timestamp> started_at,
    std::optional<Timestamp> finished_at
) {
    JobStats stats(submitted_at);
    if (started_at) {
        stats.mark_started(*started_at);
    }
    if (finished_at) {
        stats.mark_finished(*finished_at);
    }
    return stats;
}

void JobStats::mark_started(Timestamp at) {
    if (started_at_) {
        throw PreconditionError("job already started");
    }
    started_at_ = at;
}

void JobStats::mark_finished(Timestamp at) {
    if (!started_at_) {
        throw PreconditionError("job finished before it started");
    }
    if (finished_at_) {
        throw PreconditionError("job already finished");
    }
    if (at < *started_at_) {
        throw PreconditionError("finish time precedes start time");
    }
    finished_at_ = at;
}

std::chrono::nanoseconds JobStats::elapsed() const noexcept {
    if (!started_at_ || !finished_at_) {
        return std::chrono::nanoseconds::zero();
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(*finished_at_ - *started_at_);
}

// ---------------------------------------------------------------------------
// Job / JobFailedError
// ---------------------------------------------------------------------------

std::string Job::to_string() const {
    return "Job " + std::to_string(id_) + " - " + name();
}

JobFailedError::JobFailedError(Job job, std::exception_ptr inner_error)
    : std::runtime_error(failure_message(job, inner_error))
    , job_(std::move(job))
    , inner_error_(std::move(inner_error)) {}

void JobFailedError::rethrow_inner() const {
    if (inner_error_) {
        std::rethrow_exception(inner_error_);
    }
    throw *this;
}

ErrorDescription describe_exception(const std::exception_ptr& error) {
    if (!error) {
        return {"none", ""};
    }
    try {
        std::rethrow_exception(error);
    } catch (const RemoteError& e) {
        return {e.type_name(), e.what()};
    } catch (const std::exception& e) {
        return {demangle(typeid(e).name()), e.what()};
    } catch (...) {
        return {"unknown", "non-standard exception"};
    }
}

// ---------------------------------------------------------------------------
// Wire encoding
// ---------------------------------------------------------------------------

Blob encode_job(const Job& job) {
    Encoder enc;
    enc.put_u8(JOB_MESSAGE_VERSION);
    enc.put_u64(job.id());
    enc.put_string(job.function());

    enc.put_u32(static_cast<std::uint32_t>(job.args().size()));
    for (const auto& arg : job.args()) {
        enc.put_value(arg);
    }

    const auto& stats = job.stats();
    enc.put_u8(stats ? 1 : 0);
    if (stats) {
        enc.put_i64(to_ticks(stats->submitted_at()));
        put_optional_timestamp(enc, stats->started_at());
        put_optional_timestamp(enc, stats->finished_at());
    }

    const auto& result = job.result();
    enc.put_u8(result ? 1 : 0);
    if (result) {
        enc.put_value(*result);
    }

    const auto& error = job.error();
    enc.put_u8(error ? 1 : 0);
    if (error) {
        auto description = describe_exception(error->inner_error());
        enc.put_string(description.type_name);
        enc.put_string(description.message);
    }

    return enc.take();
}

Job decode_job(const Blob& payload) {
    Decoder dec(payload);

    auto version = dec.get_u8();
    if (version != JOB_MESSAGE_VERSION) {
        throw SerializationError("unsupported job message version " + std::to_string(version));
    }

    auto id = dec.get_u64();
    auto function = dec.get_string();

    auto argc = dec.get_u32();
    if (argc > dec.remaining()) {
        throw SerializationError("argument count " + std::to_string(argc) + " exceeds message");
    }
    ValueList args;
    args.reserve(argc);
    for (std::uint32_t i = 0; i < argc; i++) {
        args.push_back(dec.get_value());
    }

    Job job(id, std::move(function), std::move(args));

    if (dec.get_u8() != 0) {
        auto submitted_at = from_ticks(dec.get_i64());
        auto started_at = get_optional_timestamp(dec);
        auto finished_at = get_optional_timestamp(dec);
        try {
            job.set_stats(JobStats::restore(submitted_at, started_at, finished_at));
        } catch (const PreconditionError& e) {
            throw SerializationError(std::string("inconsistent job stats: ") + e.what());
        }
    }

    if (dec.get_u8() != 0) {
        job.set_result(dec.get_value());
    }

    if (dec.get_u8() != 0) {
        auto type_name = dec.get_string();
        auto message = dec.get_string();
        auto inner = std::make_exception_ptr(RemoteError(std::move(type_name), message));
        job.set_error(std::make_shared<const JobFailedError>(job, inner));
    }

    if (!dec.done()) {
        throw SerializationError(
            "trailing bytes after job message: " + std::to_string(dec.remaining())
        );
    }

    return job;
}

} // namespace procpool
