#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide leveled logger
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace procpool {

enum class LogLevel : std::uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

/**
 * @brief Leveled logger writing to stderr and, optionally, a log file
 *
 * The level defaults to the PROCPOOL_LOG_LEVEL environment variable
 * (error, warn, info, debug, trace) and falls back to INFO. Logging never
 * throws. The logger stays usable in a child forked while another thread
 * was writing a line.
 */
class Logger {
public:
    static void set_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    /**
     * @brief Mirror every line to a file opened in append mode
     * @return false if the file could not be opened
     */
    static bool set_file(const std::string& path) noexcept;
    static void close_file() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static LogLevel parse_level(const std::string& text, LogLevel fallback) noexcept;

private:
    static LogLevel parse_env_level() noexcept;
    static const char* level_to_string(LogLevel level) noexcept;
};

// Thread naming for better logging context
void set_thread_name(const std::string& name);
// Forget the calling thread's name; call before the thread exits
void clear_thread_name();
[[nodiscard]] std::string thread_name();
[[nodiscard]] std::size_t named_thread_count();

} // namespace procpool

#define LOG_ERROR(msg) ::procpool::Logger::error(msg)
#define LOG_WARN(msg)  ::procpool::Logger::warn(msg)
#define LOG_INFO(msg)  ::procpool::Logger::info(msg)
#define LOG_DEBUG(msg) do { if (::procpool::Logger::enabled(::procpool::LogLevel::DEBUG)) ::procpool::Logger::debug(msg); } while (0)
#define LOG_TRACE(msg) do { if (::procpool::Logger::enabled(::procpool::LogLevel::TRACE)) ::procpool::Logger::trace(msg); } while (0)
