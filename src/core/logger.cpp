/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "procpool/core/logger.hpp"

#include <pthread.h>
#include <unistd.h>

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace procpool {

namespace {

std::mutex g_log_mutex;
LogLevel g_level = LogLevel::INFO;
bool g_level_initialized = false;
std::ofstream g_file;
std::unordered_map<std::thread::id, std::string> g_thread_names;

// A child forked while another thread holds g_log_mutex would deadlock on
// its first log line. Hold the lock across fork() so both sides own it.
void lock_for_fork() { g_log_mutex.lock(); }
void unlock_after_fork() { g_log_mutex.unlock(); }

[[maybe_unused]] const bool g_atfork_registered = [] {
    return pthread_atfork(&lock_for_fork, &unlock_after_fork, &unlock_after_fork) == 0;
}();

} // namespace

void Logger::set_level(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parse_env_level();
        g_level_initialized = true;
    }
    return g_level;
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(Logger::level());
}

bool Logger::set_file(const std::string& path) noexcept {
    try {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (g_file.is_open()) {
            g_file.close();
        }
        g_file.open(path, std::ios::out | std::ios::app);
        return g_file.is_open();
    } catch (const std::exception&) {
        return false;
    }
}

void Logger::close_file() noexcept {
    try {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (g_file.is_open()) {
            g_file.close();
        }
    } catch (const std::exception&) {
        // Never throw from logging
    }
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::lock_guard<std::mutex> lock(g_log_mutex);

        std::string thread_info;
        auto it = g_thread_names.find(std::this_thread::get_id());
        if (it != g_thread_names.end()) {
            thread_info = it->second;
        } else {
            std::ostringstream oss;
            oss << "pid" << ::getpid() << "/T" << std::this_thread::get_id();
            thread_info = oss.str();
        }

        std::ostringstream ss;
        ss << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << level_to_string(level) << "]";
        ss << " [" << thread_info << "]";
        ss << " " << message;

        // Logs go to stderr - keep stdout for the application
        std::cerr << ss.str() << std::endl;
        if (g_file.is_open()) {
            g_file << ss.str() << std::endl;
        }
    } catch (const std::exception&) {
        // Never throw from logging
    }
}

LogLevel Logger::parse_level(const std::string& text, LogLevel fallback) noexcept {
    std::string level_str(text);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;

    return fallback;
}

LogLevel Logger::parse_env_level() noexcept {
    const char* env_val = std::getenv("PROCPOOL_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;
    return parse_level(env_val, LogLevel::INFO);
}

const char* Logger::level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void set_thread_name(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

void clear_thread_name() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names.erase(std::this_thread::get_id());
}

std::string thread_name() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    auto it = g_thread_names.find(std::this_thread::get_id());
    return it != g_thread_names.end() ? it->second : std::string{};
}

std::size_t named_thread_count() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_thread_names.size();
}

} // namespace procpool
