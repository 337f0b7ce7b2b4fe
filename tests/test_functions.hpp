#pragma once

/**
 * @file test_functions.hpp
 * @brief Functions registered for workers to run in tests
 */

#include <cstdint>
#include <string>

namespace procpool::test_support {

std::int64_t add(std::int64_t a, std::int64_t b);

double half(double value);

std::string echo(std::string text);

std::string repeat(std::string text, std::int64_t times);

void do_nothing();

// Throws std::invalid_argument(message)
std::int64_t fail_with(std::string message);

// Throws an int
std::int64_t throw_non_standard();

std::int64_t sleep_then_return(std::int64_t milliseconds, std::int64_t value);

// Kills the worker process
std::int64_t crash_worker(std::int64_t exit_code);

std::int64_t worker_pid();

// Never registered
std::int64_t unregistered(std::int64_t value);

} // namespace procpool::test_support
