#pragma once

#include <string>
#include <memory>
#include <functional>

namespace taco {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/// Receives every entry that passes the level filter (already formatted, without timestamp).
using LogListener = std::function<void(LogLevel, const std::string&)>;

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides leveled logging with optional file output. Components log either
 * free-form messages or typed events ("WAKE_WORD_DETECTED: Hi Taco") so the
 * log file can be grepped by event type.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Log a typed event at INFO level as "TYPE: message"
     */
    static void event(const std::string& event_type, const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();

    /**
     * @brief Install a listener that observes every emitted entry (pass nullptr to remove)
     */
    static void set_listener(LogListener listener);

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive); INFO on anything else
     */
    static LogLevel parse_level(const std::string& name);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
    static const char* level_string(LogLevel level);
};

// Convenience macros
#define LOG_DEBUG(msg) taco::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) taco::Logger::info(msg)
#define LOG_WARN(msg) taco::Logger::warn(msg)
#define LOG_ERROR(msg) taco::Logger::error(msg)
#define LOG_EVENT(type, msg) taco::Logger::event((type), (msg))

// Component-specific logging macros
#define LOG_AUDIO(msg) taco::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_WAKE(msg) taco::Logger::info(std::string("[Wake] ") + (msg))
#define LOG_SESSION(msg) taco::Logger::info(std::string("[Session] ") + (msg))
#define LOG_MUSIC(msg) taco::Logger::info(std::string("[Music] ") + (msg))
#define LOG_CACHE(msg) taco::Logger::info(std::string("[Cache] ") + (msg))
#define LOG_ORCH(msg) taco::Logger::info(std::string("[Orchestrator] ") + (msg))

} // namespace taco
