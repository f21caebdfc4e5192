/**
 * @file Logger.hpp
 * @brief Logging infrastructure for the Ascent round server
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * Thread-safe logging system with multiple severity levels, file rotation,
 * and a callback output so tests and embedders can observe log traffic.
 */

#pragma once

#ifndef ASCENT_CORE_LOGGER_HPP
#define ASCENT_CORE_LOGGER_HPP

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <mutex>
#include <memory>
#include <chrono>
#include <functional>

namespace spdlog {
class logger;
}

namespace Ascent {
namespace Core {

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    Trace = 0,      ///< Verbose tracing for deep debugging
    Debug = 1,      ///< Debug information for development
    Info = 2,       ///< General informational messages
    Warning = 3,    ///< Warning messages for potential issues
    Error = 4,      ///< Error messages for failures
    Critical = 5,   ///< Failures that stop a subsystem
    Off = 255       ///< Disable all logging
};

/**
 * @brief Log output targets
 */
enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,   ///< Output to console/stdout
    File = 1 << 1,      ///< Output to rotating file
    Callback = 1 << 2,  ///< Call user-provided callback
    All = Console | File | Callback
};

inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline LogOutput operator&(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning", "error",
 *        "critical", "off"); case-insensitive
 * @return true if the name was recognised
 */
bool ParseLogLevel(std::string_view name, LogLevel& level);

/**
 * @brief Log callback function type
 * @param level Severity level of the message
 * @param message Formatted log message
 * @param timestamp Message timestamp
 */
using LogCallback = std::function<void(LogLevel level, std::string_view message,
                                       std::chrono::system_clock::time_point timestamp)>;

/**
 * @brief Thread-safe logging system for Ascent
 *
 * Backed by spdlog. Messages below the minimum level are counted as
 * dropped; nothing is written before Initialize() succeeds.
 */
class Logger {
public:
    /**
     * @brief Get the global logger instance
     */
    static Logger& Instance();

    /**
     * @brief Initialize the logger
     * @param minLevel Minimum log level to record
     * @param outputs Output targets (console, file, callback)
     * @param logFilePath Path to log file (required if File output enabled)
     * @param maxFileSizeMB Maximum log file size in MB before rotation
     * @return true on success, false if already initialized or a sink failed
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /**
     * @brief Shutdown the logger and flush all buffers
     */
    void Shutdown();

    void SetMinLevel(LogLevel level);
    LogLevel GetMinLevel() const;

    /**
     * @brief Set user callback for log messages (Callback output)
     */
    void SetCallback(LogCallback callback);

    bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Log a message at the specified level
     * @param level Severity level
     * @param message Message text
     * @param file Source file name (optional)
     * @param line Source line number (optional)
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /**
     * @brief Log a printf-style formatted message
     */
    template<typename... Args>
    void LogFormat(LogLevel level, const char* file, int line, const char* format, Args... args) {
        if (!IsLevelEnabled(level)) {
            CountDropped();
            return;
        }

        char buffer[1024];
        int result = std::snprintf(buffer, sizeof(buffer), format, args...);

        if (result > 0 && static_cast<size_t>(result) < sizeof(buffer)) {
            Log(level, std::string_view(buffer, static_cast<size_t>(result)), file, line);
        } else if (result > 0) {
            std::string largeBuffer(static_cast<size_t>(result) + 1, '\0');
            std::snprintf(largeBuffer.data(), largeBuffer.size(), format, args...);
            largeBuffer.resize(static_cast<size_t>(result));
            Log(level, largeBuffer, file, line);
        }
    }

    /**
     * @brief Flush all buffers to disk
     */
    void Flush();

    /**
     * @brief Number of messages logged at each level
     */
    struct Statistics {
        size_t trace;
        size_t debug;
        size_t info;
        size_t warning;
        size_t error;
        size_t critical;
        size_t dropped;  ///< Messages dropped due to level filtering
    };

    Statistics GetStatistics() const;
    void ResetStatistics();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void CountDropped();
    void DispatchCallback(LogLevel level, std::string_view message);

    // Configuration
    LogLevel minLevel_ = LogLevel::Info;
    LogOutput outputs_ = LogOutput::Console;
    std::string logFilePath_;
    size_t maxFileSizeBytes_ = 10 * 1024 * 1024;

    // State
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
    bool initialized_ = false;

    std::mutex callbackMutex_;
    LogCallback callback_;

    // Statistics
    mutable std::mutex statsMutex_;
    Statistics stats_{};

    friend class CallbackSink;
};

} // namespace Core
} // namespace Ascent

// ============================================================================
// Convenience Macros
// ============================================================================

#ifndef ASCENT_DISABLE_LOGGING

#define ASCENT_LOG_TRACE(msg) \
    ::Ascent::Core::Logger::Instance().Log(::Ascent::Core::LogLevel::Trace, msg, __FILE__, __LINE__)

#define ASCENT_LOG_DEBUG(msg) \
    ::Ascent::Core::Logger::Instance().Log(::Ascent::Core::LogLevel::Debug, msg, __FILE__, __LINE__)

#define ASCENT_LOG_INFO(msg) \
    ::Ascent::Core::Logger::Instance().Log(::Ascent::Core::LogLevel::Info, msg, __FILE__, __LINE__)

#define ASCENT_LOG_WARNING(msg) \
    ::Ascent::Core::Logger::Instance().Log(::Ascent::Core::LogLevel::Warning, msg, __FILE__, __LINE__)

#define ASCENT_LOG_ERROR(msg) \
    ::Ascent::Core::Logger::Instance().Log(::Ascent::Core::LogLevel::Error, msg, __FILE__, __LINE__)

#define ASCENT_LOG_CRITICAL(msg) \
    ::Ascent::Core::Logger::Instance().Log(::Ascent::Core::LogLevel::Critical, msg, __FILE__, __LINE__)

#define ASCENT_LOG_TRACE_F(fmt, ...) \
    ::Ascent::Core::Logger::Instance().LogFormat(::Ascent::Core::LogLevel::Trace, __FILE__, __LINE__, fmt, __VA_ARGS__)

#define ASCENT_LOG_DEBUG_F(fmt, ...) \
    ::Ascent::Core::Logger::Instance().LogFormat(::Ascent::Core::LogLevel::Debug, __FILE__, __LINE__, fmt, __VA_ARGS__)

#define ASCENT_LOG_INFO_F(fmt, ...) \
    ::Ascent::Core::Logger::Instance().LogFormat(::Ascent::Core::LogLevel::Info, __FILE__, __LINE__, fmt, __VA_ARGS__)

#define ASCENT_LOG_WARNING_F(fmt, ...) \
    ::Ascent::Core::Logger::Instance().LogFormat(::Ascent::Core::LogLevel::Warning, __FILE__, __LINE__, fmt, __VA_ARGS__)

#define ASCENT_LOG_ERROR_F(fmt, ...) \
    ::Ascent::Core::Logger::Instance().LogFormat(::Ascent::Core::LogLevel::Error, __FILE__, __LINE__, fmt, __VA_ARGS__)

#define ASCENT_LOG_CRITICAL_F(fmt, ...) \
    ::Ascent::Core::Logger::Instance().LogFormat(::Ascent::Core::LogLevel::Critical, __FILE__, __LINE__, fmt, __VA_ARGS__)

#else
#define ASCENT_LOG_TRACE(msg) ((void)0)
#define ASCENT_LOG_DEBUG(msg) ((void)0)
#define ASCENT_LOG_INFO(msg) ((void)0)
#define ASCENT_LOG_WARNING(msg) ((void)0)
#define ASCENT_LOG_ERROR(msg) ((void)0)
#define ASCENT_LOG_CRITICAL(msg) ((void)0)
#define ASCENT_LOG_TRACE_F(fmt, ...) ((void)0)
#define ASCENT_LOG_DEBUG_F(fmt, ...) ((void)0)
#define ASCENT_LOG_INFO_F(fmt, ...) ((void)0)
#define ASCENT_LOG_WARNING_F(fmt, ...) ((void)0)
#define ASCENT_LOG_ERROR_F(fmt, ...) ((void)0)
#define ASCENT_LOG_CRITICAL_F(fmt, ...) ((void)0)
#endif // ASCENT_DISABLE_LOGGING

#endif // ASCENT_CORE_LOGGER_HPP
