/**
 * @file worker_test.cpp
 * @brief Unit tests for evaluate_job and the worker process loop
 */

#include <gtest/gtest.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <stdexcept>
#include <string>

#include "procpool/core/codec.hpp"
#include "procpool/core/errors.hpp"
#include "procpool/core/worker.hpp"
#include "test_functions.hpp"

using namespace procpool;

namespace {

Job submitted(JobId id, std::string function, ValueList args) {
    Job job(id, std::move(function), std::move(args));
    job.set_stats(JobStats());
    return job;
}

} // namespace

class EvaluateJobTest : public ::testing::Test {};

TEST_F(EvaluateJobTest, RecordsResultAndTiming) {
    Job job = submitted(1, "add", {Value{std::int64_t{2}}, Value{std::int64_t{3}}});

    Job done = evaluate_job(job);

    ASSERT_TRUE(done.result().has_value());
    EXPECT_EQ(std::get<std::int64_t>(*done.result()), 5);
    EXPECT_FALSE(done.failed());
    ASSERT_TRUE(done.stats()->started_at().has_value());
    ASSERT_TRUE(done.stats()->finished_at().has_value());
    EXPECT_LE(done.stats()->submitted_at(), *done.stats()->started_at());
    EXPECT_LE(*done.stats()->started_at(), *done.stats()->finished_at());
}

TEST_F(EvaluateJobTest, ReturnsCopyLeavingInputUntouched) {
    Job job = submitted(1, "add", {Value{std::int64_t{2}}, Value{std::int64_t{3}}});

    Job done = evaluate_job(job);

    EXPECT_TRUE(done.result().has_value());
    EXPECT_FALSE(job.result().has_value());
    EXPECT_FALSE(job.stats()->started_at().has_value());
}

TEST_F(EvaluateJobTest, FailureIsRecordedNotThrown) {
    Job job = submitted(2, "fail_with", {Value{std::string("boom")}});

    Job done;
    ASSERT_NO_THROW(done = evaluate_job(job));

    ASSERT_TRUE(done.failed());
    EXPECT_FALSE(done.result().has_value());
    EXPECT_EQ(done.error()->job().id(), 2u);
    EXPECT_THROW(done.error()->rethrow_inner(), std::invalid_argument);
    EXPECT_TRUE(done.stats()->finished_at().has_value());
}

TEST_F(EvaluateJobTest, NonStandardThrowIsRecorded) {
    Job done = evaluate_job(submitted(3, "throw_non_standard", {}));

    ASSERT_TRUE(done.failed());
    EXPECT_THROW(done.error()->rethrow_inner(), std::runtime_error);
}

TEST_F(EvaluateJobTest, UnknownFunctionIsRecorded) {
    Job done = evaluate_job(submitted(4, "no_such_function", {}));

    ASSERT_TRUE(done.failed());
    EXPECT_THROW(done.error()->rethrow_inner(), std::out_of_range);
}

TEST_F(EvaluateJobTest, MissingStatsIsPreconditionViolation) {
    Job job(5, "add", {Value{std::int64_t{1}}, Value{std::int64_t{1}}});
    EXPECT_THROW(evaluate_job(job), PreconditionError);
}

TEST_F(EvaluateJobTest, UsesGivenRegistry) {
    FunctionRegistry registry;
    registry.add("add", &test_support::add);

    Job done = evaluate_job(submitted(6, "add", {Value{std::int64_t{40}}, Value{std::int64_t{2}}}), registry);
    EXPECT_EQ(std::get<std::int64_t>(*done.result()), 42);

    Job missing = evaluate_job(submitted(7, "echo", {Value{std::string("x")}}), registry);
    EXPECT_TRUE(missing.failed());
}

/**
 * @brief Runs run_worker in a forked child connected by two pipes
 */
class WorkerProcessTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(to_child_), 0);
        ASSERT_EQ(::pipe(from_child_), 0);

        pid_ = ::fork();
        ASSERT_GE(pid_, 0);
        if (pid_ == 0) {
            ::close(to_child_[1]);
            ::close(from_child_[0]);
            run_worker(0, to_child_[0], from_child_[1], FunctionRegistry::global());
        }
        ::close(to_child_[0]);
        ::close(from_child_[1]);
    }

    void TearDown() override {
        if (to_child_[1] >= 0) {
            ::close(to_child_[1]);
        }
        ::close(from_child_[0]);
        if (pid_ > 0) {
            int status = 0;
            ::waitpid(pid_, &status, 0);
        }
    }

    Job round_trip(const Job& job) {
        write_frame(to_child_[1], encode_job(job));
        auto frame = read_frame(from_child_[0]);
        if (!frame) {
            throw std::runtime_error("worker closed its pipe");
        }
        return decode_job(*frame);
    }

    int stop_worker() {
        ::close(to_child_[1]);
        to_child_[1] = -1;
        int status = 0;
        ::waitpid(pid_, &status, 0);
        pid_ = -1;
        return status;
    }

    int to_child_[2]{-1, -1};
    int from_child_[2]{-1, -1};
    pid_t pid_{-1};
};

TEST_F(WorkerProcessTest, RunsJobsInAnotherProcess) {
    Job done = round_trip(submitted(1, "worker_pid", {}));

    ASSERT_TRUE(done.result().has_value());
    EXPECT_EQ(std::get<std::int64_t>(*done.result()), static_cast<std::int64_t>(pid_));
    EXPECT_NE(std::get<std::int64_t>(*done.result()), static_cast<std::int64_t>(::getpid()));
}

TEST_F(WorkerProcessTest, ServesSeveralJobs) {
    for (std::int64_t i = 0; i < 5; i++) {
        Job done = round_trip(submitted(static_cast<JobId>(i + 1), "add", {Value{i}, Value{i}}));
        EXPECT_EQ(done.id(), static_cast<JobId>(i + 1));
        EXPECT_EQ(std::get<std::int64_t>(*done.result()), 2 * i);
    }
}

TEST_F(WorkerProcessTest, FailureTravelsBackAsRemoteError) {
    Job done = round_trip(submitted(9, "fail_with", {Value{std::string("boom")}}));

    ASSERT_TRUE(done.failed());
    try {
        done.error()->rethrow_inner();
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.type_name(), "std::invalid_argument");
        EXPECT_STREQ(e.what(), "boom");
    }
}

TEST_F(WorkerProcessTest, UnsubmittedJobIsRejected) {
    Job done = round_trip(Job(3, "add", {Value{std::int64_t{1}}, Value{std::int64_t{1}}}));

    EXPECT_EQ(done.id(), 0u);
    ASSERT_TRUE(done.failed());
    EXPECT_THROW(done.error()->rethrow_inner(), RemoteError);
}

TEST_F(WorkerProcessTest, ExitsCleanlyOnEof) {
    round_trip(submitted(1, "do_nothing", {}));

    int status = stop_worker();
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
