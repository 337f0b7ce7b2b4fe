#pragma once

/**
 * @file resource.hpp
 * @brief Acquire/release resources bound to a C++ scope
 */

#include <exception>
#include <memory>

#include "procpool/core/errors.hpp"
#include "procpool/core/event_loop.hpp"
#include "procpool/core/logger.hpp"
#include "procpool/core/worker_pool.hpp"

namespace procpool {

/**
 * @brief How the scope holding a resource was left
 */
enum class ScopeOutcome {
    Success,
    Exception
};

/**
 * @brief Something that is acquired on scope entry and released on exit
 */
template<typename T>
class Resource {
public:
    virtual ~Resource() = default;

    /**
     * @brief Create or open the resource
     */
    virtual T& acquire() = 0;

    /**
     * @brief Tear the resource down; must not throw
     */
    virtual void release(T& resource, ScopeOutcome outcome) noexcept = 0;
};

/**
 * @brief Holds a Resource for the lifetime of a C++ scope
 *
 * Acquires in the constructor and releases in the destructor, reporting
 * ScopeOutcome::Exception when the scope is being unwound.
 */
template<typename T>
class ResourceScope {
public:
    explicit ResourceScope(Resource<T>& resource)
        : resource_(resource)
        , value_(&resource.acquire())
        , uncaught_on_entry_(std::uncaught_exceptions()) {}

    ~ResourceScope() {
        auto outcome = std::uncaught_exceptions() > uncaught_on_entry_
            ? ScopeOutcome::Exception
            : ScopeOutcome::Success;
        resource_.release(*value_, outcome);
    }

    ResourceScope(const ResourceScope&) = delete;
    ResourceScope& operator=(const ResourceScope&) = delete;

    [[nodiscard]] T& get() noexcept { return *value_; }
    T* operator->() noexcept { return value_; }
    T& operator*() noexcept { return *value_; }

private:
    Resource<T>& resource_;
    T* value_;
    int uncaught_on_entry_;
};

/**
 * @brief Builds a WorkerPool on acquire and terminates it on release
 *
 * Release never drains: outstanding jobs are killed.
 */
class WorkerPoolResource final : public Resource<WorkerPool> {
public:
    explicit WorkerPoolResource(EventLoop& loop, WorkerPoolConfig config = {})
        : loop_(&loop)
        , config_(config) {}

    explicit WorkerPoolResource(WorkerPoolConfig config = {})
        : config_(config) {}

    /**
     * @throws InvalidStateError if the pool is already acquired
     */
    WorkerPool& acquire() override {
        if (pool_) {
            throw InvalidStateError("worker pool already acquired");
        }
        pool_ = loop_ != nullptr
            ? std::make_unique<WorkerPool>(*loop_, config_)
            : std::make_unique<WorkerPool>(config_);
        return *pool_;
    }

    void release(WorkerPool& pool, ScopeOutcome outcome) noexcept override {
        if (outcome == ScopeOutcome::Exception) {
            LOG_WARN("worker pool scope left by an exception, terminating outstanding jobs");
        }
        pool.terminate();
        pool_.reset();
    }

    [[nodiscard]] bool acquired() const noexcept { return pool_ != nullptr; }

private:
    EventLoop* loop_{nullptr};
    WorkerPoolConfig config_;
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace procpool
