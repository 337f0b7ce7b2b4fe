#pragma once

/**
 * @file metrics.hpp
 * @brief Pool metrics: counters, gauges and a job latency histogram
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace procpool {

/**
 * @brief Counter metric (monotonically increasing)
 */
class Counter {
public:
    void increment(std::uint64_t value = 1) noexcept {
        value_.fetch_add(value, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> value_{0};
};

/**
 * @brief Gauge metric (can go up and down)
 */
class Gauge {
public:
    void increment(std::int64_t delta = 1) noexcept {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    void decrement(std::int64_t delta = 1) noexcept {
        value_.fetch_sub(delta, std::memory_order_relaxed);
    }

    [[nodiscard]] std::int64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::int64_t> value_{0};
};

/**
 * @brief Histogram of job durations in seconds
 *
 * Bucket i counts observations <= bounds[i]; the last count is the +Inf
 * bucket.
 */
class Histogram {
public:
    explicit Histogram(std::vector<double> bounds = default_bounds())
        : bounds_(std::move(bounds))
        , counts_(bounds_.size() + 1, 0) {}

    void observe(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        sum_ += value;
        count_++;
        if (count_ == 1 || value > max_) {
            max_ = value;
        }

        for (std::size_t i = 0; i < bounds_.size(); i++) {
            if (value <= bounds_[i]) {
                counts_[i]++;
                return;
            }
        }
        counts_.back()++;
    }

    [[nodiscard]] std::uint64_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    [[nodiscard]] double mean() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0;
    }

    [[nodiscard]] double max() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_;
    }

    [[nodiscard]] const std::vector<double>& bounds() const noexcept { return bounds_; }

    [[nodiscard]] std::vector<std::uint64_t> bucket_counts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return counts_;
    }

    static std::vector<double> default_bounds() {
        return {0.001, 0.01, 0.05, 0.1, 0.5, 1.0, 5.0, 30.0, 60.0, 300.0};
    }

private:
    mutable std::mutex mutex_;
    const std::vector<double> bounds_;
    std::vector<std::uint64_t> counts_;
    double sum_{0.0};
    double max_{0.0};
    std::uint64_t count_{0};
};

/**
 * @brief Point-in-time view of PoolMetrics
 */
struct PoolMetricsSnapshot {
    std::uint64_t jobs_submitted{0};
    std::uint64_t jobs_completed{0};
    std::uint64_t jobs_failed{0};
    std::int64_t jobs_in_flight{0};
    double jobs_per_second{0.0};
    double avg_job_seconds{0.0};
    double max_job_seconds{0.0};
    std::chrono::steady_clock::time_point timestamp;
};

/**
 * @brief Metrics of one WorkerPool
 *
 * jobs_completed counts every job whose outcome was delivered, failed or
 * not; jobs_failed counts the failed subset.
 */
class PoolMetrics {
public:
    PoolMetrics() : start_time_(std::chrono::steady_clock::now()) {}

    Counter& jobs_submitted() { return jobs_submitted_; }
    Counter& jobs_completed() { return jobs_completed_; }
    Counter& jobs_failed() { return jobs_failed_; }
    Gauge& jobs_in_flight() { return in_flight_; }
    Histogram& job_latency() { return latency_; }

    /**
     * @brief Record a job leaving the pool
     */
    void record_completion(bool failed, double elapsed_seconds) {
        jobs_completed_.increment();
        if (failed) {
            jobs_failed_.increment();
        }
        in_flight_.decrement();
        latency_.observe(elapsed_seconds);
    }

    /**
     * @brief Record a job the pool failed before it ran to the end
     *
     * Counted as completed and failed; no latency sample.
     */
    void record_pool_failure() noexcept {
        jobs_completed_.increment();
        jobs_failed_.increment();
        in_flight_.decrement();
    }

    [[nodiscard]] PoolMetricsSnapshot snapshot() const {
        auto now = std::chrono::steady_clock::now();
        auto seconds = std::chrono::duration<double>(now - start_time_).count();

        PoolMetricsSnapshot metrics;
        metrics.timestamp = now;
        metrics.jobs_submitted = jobs_submitted_.value();
        metrics.jobs_completed = jobs_completed_.value();
        metrics.jobs_failed = jobs_failed_.value();
        metrics.jobs_in_flight = in_flight_.value();
        metrics.jobs_per_second = seconds > 0.0
            ? static_cast<double>(metrics.jobs_completed) / seconds
            : 0.0;
        metrics.avg_job_seconds = latency_.mean();
        metrics.max_job_seconds = latency_.max();
        return metrics;
    }

    /**
     * @brief Format metrics as a single log line
     */
    [[nodiscard]] std::string format() const {
        auto m = snapshot();
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        oss << "Submitted: " << m.jobs_submitted
            << " | Completed: " << m.jobs_completed
            << " | Failed: " << m.jobs_failed
            << " | In flight: " << m.jobs_in_flight
            << " | Rate: " << m.jobs_per_second << " jobs/s"
            << " | Avg: " << m.avg_job_seconds * 1000.0 << " ms";
        return oss.str();
    }

    [[nodiscard]] std::chrono::milliseconds uptime() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_
        );
    }

private:
    std::chrono::steady_clock::time_point start_time_;

    Counter jobs_submitted_;
    Counter jobs_completed_;
    Counter jobs_failed_;
    Gauge in_flight_;
    Histogram latency_;
};

} // namespace procpool
