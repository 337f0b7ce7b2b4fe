/**
 * @file worker_pool_test.cpp
 * @brief End-to-end tests: submitting, joining and awaiting jobs
 */

#include <gtest/gtest.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "procpool/core/codec.hpp"
#include "procpool/procpool.hpp"
#include "test_functions.hpp"

using namespace procpool;
using namespace std::chrono_literals;
namespace fn = procpool::test_support;

namespace {

WorkerPoolConfig config_with(std::uint32_t workers, FailurePolicy policy = FailurePolicy::Surface) {
    WorkerPoolConfig config;
    config.num_workers = workers;
    config.failure_policy = policy;
    return config;
}

template<typename R>
Task<ResultOf<R>> await_handle(std::shared_ptr<AsyncJobHandle<R>> handle) {
    co_return co_await *handle;
}

} // namespace

class WorkerPoolTest : public ::testing::Test {
protected:
    EventLoop loop;
};

TEST_F(WorkerPoolTest, AwaitedSubmissionYieldsResult) {
    WorkerPool pool(loop, config_with(2));

    auto handle = pool.submit(fn::add, 2, 3);
    EXPECT_EQ(loop.run_until_complete(await_handle(handle)), 5);

    EXPECT_TRUE(handle->job().result().has_value());
    EXPECT_TRUE(handle->stats().finished_at().has_value());
}

TEST_F(WorkerPoolTest, ManyAwaitsOnOneLoop) {
    WorkerPool pool(loop, config_with(3));

    auto sum_all = [&]() -> Task<std::int64_t> {
        std::vector<std::shared_ptr<AsyncJobHandle<std::int64_t>>> handles;
        for (std::int64_t i = 1; i <= 20; i++) {
            handles.push_back(pool.submit(fn::add, i, i));
        }
        std::int64_t total = 0;
        for (auto& handle : handles) {
            total += co_await *handle;
        }
        co_return total;
    };

    EXPECT_EQ(loop.run_until_complete(sum_all()), 420);
}

TEST_F(WorkerPoolTest, AsyncHandleCanBeJoinedFromAnotherThread) {
    WorkerPool pool(loop, config_with(1));

    auto handle = pool.submit(fn::add, 2, 3);
    EXPECT_EQ(handle->join(), 5);
    EXPECT_TRUE(handle->done());
}

TEST_F(WorkerPoolTest, AwaitingDoesNotBlockOtherLoopTasks) {
    WorkerPool pool(loop, config_with(1));

    int ticks = 0;
    int ticks_when_resumed = -1;
    auto ticker = [&]() -> Task<void> {
        for (int i = 0; i < 5; i++) {
            co_await sleep(loop, 30ms);
            ticks++;
        }
    };
    auto slow_job = [&]() -> Task<std::int64_t> {
        std::int64_t value = co_await *pool.submit(fn::sleep_then_return, 300, 7);
        ticks_when_resumed = ticks;
        co_return value;
    };

    loop.spawn(ticker());
    EXPECT_EQ(loop.run_until_complete(slow_job()), 7);
    EXPECT_GE(ticks_when_resumed, 3);
}

TEST_F(WorkerPoolTest, JobIdsIncreaseInSubmissionOrder) {
    WorkerPool pool(loop, config_with(2));

    std::vector<std::shared_ptr<AsyncJobHandle<std::int64_t>>> handles;
    for (std::int64_t i = 0; i < 10; i++) {
        handles.push_back(pool.submit(fn::add, i, i));
    }
    for (std::size_t i = 0; i + 1 < handles.size(); i++) {
        EXPECT_LT(handles[i]->job_id(), handles[i + 1]->job_id());
    }
    for (auto& handle : handles) {
        handle->join();
    }
}

TEST_F(WorkerPoolTest, OversizedArgumentsAreRejectedAtSubmission) {
    WorkerPool pool(config_with(1));

    EXPECT_THROW(pool.submit_blocking(fn::echo, std::string(MAX_FRAME_SIZE, 'x')), SerializationError);

    // The supervisor survives and nothing was counted as submitted
    EXPECT_EQ(pool.submit_blocking(fn::add, 1, 2)->join(), 3);
    EXPECT_EQ(pool.process_pool().stats().workers_respawned, 0u);
    auto snapshot = pool.metrics().snapshot();
    EXPECT_EQ(snapshot.jobs_submitted, 1u);
    EXPECT_EQ(snapshot.jobs_in_flight, 0);
}

TEST_F(WorkerPoolTest, OversizedResultFailsJobWithoutKillingWorker) {
    WorkerPool pool(config_with(1));
    auto pids_before = pool.process_pool().worker_pids();

    auto handle = pool.submit_blocking(fn::repeat, "x", static_cast<std::int64_t>(MAX_FRAME_SIZE));
    try {
        handle->join();
        FAIL() << "expected JobFailedError";
    } catch (const JobFailedError& e) {
        EXPECT_THROW(e.rethrow_inner(), RemoteError);
    }

    EXPECT_EQ(pool.submit_blocking(fn::echo, std::string("alive"))->join(), "alive");
    EXPECT_EQ(pool.process_pool().stats().workers_respawned, 0u);
    EXPECT_EQ(pool.process_pool().worker_pids(), pids_before);
}

TEST_F(WorkerPoolTest, BlockingJoinWithoutLoop) {
    WorkerPool pool(config_with(2));

    auto handle = pool.submit_blocking(fn::repeat, "ab", 3);
    EXPECT_EQ(handle->join(), "ababab");
    EXPECT_TRUE(handle->done());

    auto stats = handle->stats();
    ASSERT_TRUE(stats.started_at().has_value());
    ASSERT_TRUE(stats.finished_at().has_value());
    EXPECT_LE(stats.submitted_at(), *stats.started_at());
    EXPECT_LE(*stats.started_at(), *stats.finished_at());
}

TEST_F(WorkerPoolTest, ArgumentsConvertToParameterTypes) {
    WorkerPool pool(config_with(1));

    EXPECT_DOUBLE_EQ(pool.submit_blocking(fn::half, 3)->join(), 1.5);
    EXPECT_EQ(pool.submit_blocking(fn::echo, std::string("text"))->join(), "text");
}

TEST_F(WorkerPoolTest, VoidFunctionResolvesToMonostate) {
    WorkerPool pool(loop, config_with(1));

    EXPECT_EQ(pool.submit_blocking(fn::do_nothing)->join(), std::monostate{});
    EXPECT_EQ(loop.run_until_complete(await_handle(pool.submit(fn::do_nothing))), std::monostate{});
}

TEST_F(WorkerPoolTest, JobsRunInWorkerProcesses) {
    WorkerPool pool(config_with(2));

    auto pid = pool.submit_blocking(fn::worker_pid)->join();
    EXPECT_NE(pid, static_cast<std::int64_t>(::getpid()));

    auto pids = pool.process_pool().worker_pids();
    EXPECT_NE(std::find(pids.begin(), pids.end(), static_cast<pid_t>(pid)), pids.end());
}

TEST_F(WorkerPoolTest, JobIdsAreUniqueUnderConcurrentSubmission) {
    WorkerPool pool(config_with(4));

    std::mutex mutex;
    std::vector<std::shared_ptr<JobHandle<std::int64_t>>> handles;
    std::vector<std::thread> submitters;
    for (int t = 0; t < 4; t++) {
        submitters.emplace_back([&, t] {
            for (std::int64_t i = 0; i < 25; i++) {
                auto handle = pool.submit_blocking(fn::add, t, i);
                std::lock_guard<std::mutex> lock(mutex);
                handles.push_back(handle);
            }
        });
    }
    for (auto& thread : submitters) {
        thread.join();
    }

    std::set<JobId> ids;
    for (auto& handle : handles) {
        ids.insert(handle->job_id());
        handle->join();
    }
    ASSERT_EQ(ids.size(), 100u);
    EXPECT_EQ(*ids.begin(), 1u);
    EXPECT_EQ(*ids.rbegin(), 100u);
}

TEST_F(WorkerPoolTest, SurfacedFailureThrowsFromJoin) {
    WorkerPool pool(config_with(1, FailurePolicy::Surface));

    auto handle = pool.submit_blocking(fn::fail_with, "boom");
    try {
        handle->join();
        FAIL() << "expected JobFailedError";
    } catch (const JobFailedError& e) {
        EXPECT_EQ(e.job().id(), handle->job_id());
        try {
            e.rethrow_inner();
        } catch (const RemoteError& inner) {
            EXPECT_EQ(inner.type_name(), "std::invalid_argument");
            EXPECT_STREQ(inner.what(), "boom");
        }
    }
    EXPECT_TRUE(handle->job().failed());
}

TEST_F(WorkerPoolTest, SurfacedFailureThrowsInnerErrorFromAwait) {
    WorkerPool pool(loop, config_with(1, FailurePolicy::Surface));

    auto handle = pool.submit(fn::fail_with, "boom");
    EXPECT_THROW(loop.run_until_complete(await_handle(handle)), RemoteError);
}

TEST_F(WorkerPoolTest, AbsorbedFailureResolvesWithDefault) {
    WorkerPool pool(loop, config_with(1, FailurePolicy::Absorb));

    auto blocking = pool.submit_blocking(fn::fail_with, "boom");
    EXPECT_EQ(blocking->join(), 0);
    ASSERT_TRUE(blocking->job().failed());
    EXPECT_THROW(blocking->job().error()->rethrow_inner(), RemoteError);

    auto awaited = pool.submit(fn::fail_with, "boom");
    EXPECT_EQ(loop.run_until_complete(await_handle(awaited)), 0);
    EXPECT_TRUE(awaited->job().failed());
}

TEST_F(WorkerPoolTest, WorkerCrashSurfacesUnderEitherPolicy) {
    for (auto policy : {FailurePolicy::Surface, FailurePolicy::Absorb}) {
        WorkerPool pool(loop, config_with(1, policy));

        EXPECT_THROW(pool.submit_blocking(fn::crash_worker, 3)->join(), JobFailedError);
        EXPECT_THROW(loop.run_until_complete(await_handle(pool.submit(fn::crash_worker, 3))), WorkerCrashedError);

        // The pool keeps serving after a crash
        EXPECT_EQ(pool.submit_blocking(fn::add, 1, 1)->join(), 2);
    }
}

TEST_F(WorkerPoolTest, TerminationLeavesHandlesUnresolved) {
    WorkerPool pool(config_with(1));

    auto handle = pool.submit_blocking(fn::sleep_then_return, 5000, 1);
    std::this_thread::sleep_for(50ms);
    pool.terminate();

    EXPECT_EQ(pool.state(), WorkerPoolState::Closed);
    EXPECT_FALSE(handle->join_for(200ms).has_value());
    EXPECT_FALSE(handle->done());
}

TEST_F(WorkerPoolTest, SubmitAfterTerminateThrows) {
    WorkerPool pool(loop, config_with(1));
    pool.terminate();
    pool.terminate();

    EXPECT_THROW(pool.submit_blocking(fn::add, 1, 2), PoolClosedError);
    EXPECT_THROW(pool.submit(fn::add, 1, 2), PoolClosedError);
}

TEST_F(WorkerPoolTest, UnregisteredFunctionIsRejected) {
    WorkerPool pool(config_with(1));
    EXPECT_THROW(pool.submit_blocking(fn::unregistered, 1), SubmissionError);
}

TEST_F(WorkerPoolTest, AsyncSubmitRequiresLoop) {
    WorkerPool pool(config_with(1));
    EXPECT_EQ(pool.loop(), nullptr);
    EXPECT_THROW(pool.submit(fn::add, 1, 2), SubmissionError);
}

TEST_F(WorkerPoolTest, MetricsCountOutcomes) {
    WorkerPool pool(config_with(2, FailurePolicy::Absorb));

    std::vector<std::shared_ptr<JobHandle<std::int64_t>>> handles;
    for (std::int64_t i = 0; i < 4; i++) {
        handles.push_back(pool.submit_blocking(fn::add, i, 1));
    }
    handles.push_back(pool.submit_blocking(fn::fail_with, "boom"));
    for (auto& handle : handles) {
        handle->join();
    }

    auto snapshot = pool.metrics().snapshot();
    EXPECT_EQ(snapshot.jobs_submitted, 5u);
    EXPECT_EQ(snapshot.jobs_completed, 5u);
    EXPECT_EQ(snapshot.jobs_failed, 1u);
    EXPECT_EQ(snapshot.jobs_in_flight, 0);
    EXPECT_EQ(pool.metrics().job_latency().count(), 5u);

    auto line = pool.format_stats();
    EXPECT_NE(line.find("Completed: 5"), std::string::npos);
    EXPECT_NE(line.find("Respawned: 0"), std::string::npos);
}

TEST_F(WorkerPoolTest, CrashedJobsAddNoLatencySample) {
    WorkerPool pool(config_with(1));

    EXPECT_EQ(pool.submit_blocking(fn::add, 1, 1)->join(), 2);
    EXPECT_THROW(pool.submit_blocking(fn::crash_worker, 3)->join(), JobFailedError);

    auto snapshot = pool.metrics().snapshot();
    EXPECT_EQ(snapshot.jobs_completed, 2u);
    EXPECT_EQ(snapshot.jobs_failed, 1u);
    EXPECT_EQ(snapshot.jobs_in_flight, 0);
    EXPECT_EQ(pool.metrics().job_latency().count(), 1u);
}

TEST_F(WorkerPoolTest, AutoDetectedWorkerCountIsReported) {
    WorkerPool pool;
    EXPECT_GT(pool.num_workers(), 0u);
    EXPECT_EQ(pool.config().num_workers, pool.num_workers());
    EXPECT_EQ(pool.failure_policy(), FailurePolicy::Surface);
}

class WorkerPoolResourceTest : public ::testing::Test {
protected:
    EventLoop loop;
};

TEST_F(WorkerPoolResourceTest, ScopeTerminatesPoolOnExit) {
    WorkerPoolResource resource(loop, config_with(1));
    {
        ResourceScope<WorkerPool> pool(resource);
        EXPECT_TRUE(resource.acquired());
        EXPECT_EQ(loop.run_until_complete(await_handle(pool->submit(fn::add, 20, 22))), 42);
    }
    EXPECT_FALSE(resource.acquired());
}

TEST_F(WorkerPoolResourceTest, ScopeReleasesWhenUnwinding) {
    WorkerPoolResource resource(config_with(1));
    try {
        ResourceScope<WorkerPool> pool(resource);
        pool->submit_blocking(fn::sleep_then_return, 5000, 1);
        throw std::runtime_error("leaving early");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(resource.acquired());
}

TEST_F(WorkerPoolResourceTest, AcquiringTwiceThrows) {
    WorkerPoolResource resource(config_with(1));
    ResourceScope<WorkerPool> pool(resource);
    EXPECT_THROW(resource.acquire(), InvalidStateError);
}
