/**
 * @file handle_test.cpp
 * @brief Unit tests for JobHandle and AsyncJobHandle callbacks
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "procpool/core/errors.hpp"
#include "procpool/core/event_loop.hpp"
#include "procpool/core/future.hpp"
#include "procpool/core/handle.hpp"

using namespace procpool;
using namespace std::chrono_literals;

namespace {

Job submitted_job(JobId id) {
    Job job(id, "add", {Value{std::int64_t{2}}, Value{std::int64_t{3}}});
    job.set_stats(JobStats());
    return job;
}

Job completed(Job job, Value result) {
    job.stats()->mark_started();
    job.stats()->mark_finished();
    job.set_result(std::move(result));
    return job;
}

Job failed(Job job, std::exception_ptr inner) {
    job.stats()->mark_started();
    job.stats()->mark_finished();
    job.set_error(std::make_shared<const JobFailedError>(job, std::move(inner)));
    return job;
}

template<typename R>
Task<ResultOf<R>> await_handle(std::shared_ptr<AsyncJobHandle<R>> handle) {
    co_return co_await *handle;
}

} // namespace

class JobHandleTest : public ::testing::Test {};

TEST_F(JobHandleTest, UnsubmittedJobViolatesPreconditions) {
    JobHandle<std::int64_t> handle(Job(1, "add", {}));

    EXPECT_EQ(handle.job_id(), 1u);
    EXPECT_THROW(static_cast<void>(handle.stats()), PreconditionError);
    EXPECT_THROW(handle.join(), PreconditionError);
    EXPECT_THROW(handle.join_for(10ms), PreconditionError);
}

TEST_F(JobHandleTest, JoinWithoutPoolTaskViolatesPrecondition) {
    JobHandle<std::int64_t> handle(submitted_job(1));

    EXPECT_NO_THROW(static_cast<void>(handle.stats()));
    EXPECT_THROW(handle.join(), PreconditionError);
    EXPECT_FALSE(handle.done());
}

TEST_F(JobHandleTest, SuccessReplacesJob) {
    Job original = submitted_job(4);
    JobHandle<std::int64_t> handle(original);

    handle.on_success(completed(original, Value{std::int64_t{5}}));

    Job current = handle.job();
    ASSERT_TRUE(current.result().has_value());
    EXPECT_EQ(std::get<std::int64_t>(*current.result()), 5);
    EXPECT_TRUE(handle.stats().finished_at().has_value());
    EXPECT_EQ(handle.job_id(), 4u);

    // The submitter's own copy never sees the worker's mutations
    EXPECT_FALSE(original.result().has_value());
}

TEST_F(JobHandleTest, FailureReplacesJobWithErrorsJob) {
    Job original = submitted_job(6);
    JobHandle<std::int64_t> handle(original);

    Job crashed = original;
    crashed.stats()->mark_started();
    auto error = std::make_exception_ptr(JobFailedError(
        crashed, std::make_exception_ptr(WorkerCrashedError("worker died"))
    ));
    handle.on_failure(error);

    EXPECT_TRUE(handle.stats().started_at().has_value());
}

TEST_F(JobHandleTest, FailureRequiresJobFailedError) {
    JobHandle<std::int64_t> handle(submitted_job(1));

    EXPECT_THROW(
        handle.on_failure(std::make_exception_ptr(std::runtime_error("plain"))),
        std::invalid_argument
    );
    EXPECT_THROW(handle.on_failure(nullptr), std::invalid_argument);
    EXPECT_THROW(handle.on_failure(std::make_exception_ptr(42)), std::invalid_argument);
}

TEST_F(JobHandleTest, ResolveConvertsResult) {
    Job done = completed(submitted_job(1), Value{std::int64_t{5}});
    EXPECT_EQ(JobHandle<int>::resolve(done, FailurePolicy::Surface), 5);
    EXPECT_DOUBLE_EQ(JobHandle<double>::resolve(done, FailurePolicy::Surface), 5.0);
}

TEST_F(JobHandleTest, ResolveVoidGivesMonostate) {
    Job done = completed(submitted_job(1), Value{});
    EXPECT_EQ(JobHandle<void>::resolve(done, FailurePolicy::Surface), std::monostate{});
}

TEST_F(JobHandleTest, SurfacePolicyThrowsJobFailedError) {
    Job done = failed(submitted_job(3), std::make_exception_ptr(std::invalid_argument("boom")));

    try {
        JobHandle<std::int64_t>::resolve(done, FailurePolicy::Surface);
        FAIL() << "expected JobFailedError";
    } catch (const JobFailedError& e) {
        EXPECT_EQ(e.job().id(), 3u);
        EXPECT_THROW(e.rethrow_inner(), std::invalid_argument);
    }
}

TEST_F(JobHandleTest, AbsorbPolicyYieldsDefaultValue) {
    Job done = failed(submitted_job(3), std::make_exception_ptr(std::invalid_argument("boom")));

    EXPECT_EQ(JobHandle<std::int64_t>::resolve(done, FailurePolicy::Absorb), 0);
    EXPECT_EQ(JobHandle<std::string>::resolve(done, FailurePolicy::Absorb), "");
}

TEST_F(JobHandleTest, ToStringNamesJob) {
    JobHandle<std::int64_t> handle(submitted_job(12));
    EXPECT_EQ(handle.to_string(), "(Handle) Job 12 - add");
}

class AsyncJobHandleTest : public ::testing::Test {
protected:
    template<typename R>
    std::shared_ptr<AsyncJobHandle<R>> make_handle(Job job, FailurePolicy policy = FailurePolicy::Surface) {
        return std::make_shared<AsyncJobHandle<R>>(job, loop.create_future<ResultOf<R>>(), policy);
    }

    EventLoop loop;
};

TEST_F(AsyncJobHandleTest, ResolvesFromCompletionThread) {
    Job job = submitted_job(1);
    auto handle = make_handle<std::int64_t>(job);

    std::thread completion([&] {
        std::this_thread::sleep_for(10ms);
        handle->on_success(completed(job, Value{std::int64_t{5}}));
    });

    EXPECT_EQ(loop.run_until_complete(await_handle(handle)), 5);
    completion.join();

    EXPECT_TRUE(handle->future().done());
    EXPECT_TRUE(handle->job().result().has_value());
}

TEST_F(AsyncJobHandleTest, RejectsWithInnerError) {
    Job job = submitted_job(2);
    auto handle = make_handle<std::int64_t>(job);

    std::thread completion([&] {
        auto error = std::make_exception_ptr(JobFailedError(
            job, std::make_exception_ptr(WorkerCrashedError("worker died"))
        ));
        handle->on_failure(error);
    });

    EXPECT_THROW(loop.run_until_complete(await_handle(handle)), WorkerCrashedError);
    completion.join();
}

TEST_F(AsyncJobHandleTest, SurfacedFunctionFailureRejects) {
    Job job = submitted_job(3);
    auto handle = make_handle<std::int64_t>(job, FailurePolicy::Surface);

    std::thread completion([&] {
        handle->on_success(failed(job, std::make_exception_ptr(std::invalid_argument("boom"))));
    });

    EXPECT_THROW(loop.run_until_complete(await_handle(handle)), std::invalid_argument);
    completion.join();
}

TEST_F(AsyncJobHandleTest, AbsorbedFunctionFailureResolvesWithDefault) {
    Job job = submitted_job(4);
    auto handle = make_handle<std::int64_t>(job, FailurePolicy::Absorb);

    std::thread completion([&] {
        handle->on_success(failed(job, std::make_exception_ptr(std::invalid_argument("boom"))));
    });

    EXPECT_EQ(loop.run_until_complete(await_handle(handle)), 0);
    completion.join();
    EXPECT_TRUE(handle->job().failed());
}

TEST_F(AsyncJobHandleTest, WrongResultTypeRejects) {
    Job job = submitted_job(5);
    auto handle = make_handle<std::int64_t>(job);

    std::thread completion([&] {
        handle->on_success(completed(job, Value{std::string("not a number")}));
    });

    EXPECT_THROW(loop.run_until_complete(await_handle(handle)), SerializationError);
    completion.join();
}

TEST_F(AsyncJobHandleTest, FailureTypeCheckedOnCallingThread) {
    auto handle = make_handle<std::int64_t>(submitted_job(6));
    EXPECT_THROW(
        handle->on_failure(std::make_exception_ptr(std::runtime_error("plain"))),
        std::invalid_argument
    );
    EXPECT_EQ(loop.pending(), 0u);
}
