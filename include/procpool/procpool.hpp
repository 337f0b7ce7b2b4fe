#pragma once

/**
 * @file procpool.hpp
 * @brief Main header for procpool - process-isolated job execution
 *
 * Include this single header to access the full procpool API.
 */

#include "procpool/core/errors.hpp"
#include "procpool/core/value.hpp"
#include "procpool/core/codec.hpp"
#include "procpool/core/job.hpp"
#include "procpool/core/registry.hpp"
#include "procpool/core/worker.hpp"
#include "procpool/core/queue.hpp"
#include "procpool/core/logger.hpp"
#include "procpool/core/process_pool.hpp"
#include "procpool/core/task.hpp"
#include "procpool/core/event_loop.hpp"
#include "procpool/core/future.hpp"
#include "procpool/core/handle.hpp"
#include "procpool/core/metrics.hpp"
#include "procpool/core/worker_pool.hpp"
#include "procpool/core/resource.hpp"

namespace procpool {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace procpool
