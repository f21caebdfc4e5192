/**
 * @file Logger.cpp
 * @brief Implementation of the logging infrastructure
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * This implementation uses spdlog with a colour console sink, a rotating
 * file sink and a small callback sink.
 */

#include "Ascent/Core/Logger.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

namespace Ascent {
namespace Core {

namespace {

spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
        default:                 return spdlog::level::info;
    }
}

LogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warning;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Critical;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

} // namespace

// ============================================================================
// CallbackSink - forwards formatted payloads to Logger::callback_
// ============================================================================

// The user callback runs under the sink lock; it must not log.
class CallbackSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    explicit CallbackSink(Logger& owner) : owner_(owner) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        owner_.DispatchCallback(FromSpdlogLevel(msg.level),
                                std::string_view(msg.payload.data(), msg.payload.size()));
    }

    void flush_() override {}

private:
    Logger& owner_;
};

bool ParseLogLevel(std::string_view name, LogLevel& level) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")                       { level = LogLevel::Trace;    return true; }
    if (lower == "debug")                       { level = LogLevel::Debug;    return true; }
    if (lower == "info")                        { level = LogLevel::Info;     return true; }
    if (lower == "warning" || lower == "warn")  { level = LogLevel::Warning;  return true; }
    if (lower == "error")                       { level = LogLevel::Error;    return true; }
    if (lower == "critical")                    { level = LogLevel::Critical; return true; }
    if (lower == "off")                         { level = LogLevel::Off;      return true; }
    return false;
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

bool Logger::Initialize(LogLevel minLevel, LogOutput outputs,
                        const std::string& logFilePath, size_t maxFileSizeMB) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    minLevel_ = minLevel;
    outputs_ = outputs;
    logFilePath_ = logFilePath;
    maxFileSizeBytes_ = maxFileSizeMB * 1024 * 1024;

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (hasFlag(outputs_, LogOutput::Console)) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }

        if (hasFlag(outputs_, LogOutput::File) && !logFilePath_.empty()) {
            std::filesystem::path logPath(logFilePath_);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }

            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath_,
                maxFileSizeBytes_,
                3 // Keep 3 rotated files
            ));
        }

        if (hasFlag(outputs_, LogOutput::Callback)) {
            sinks.push_back(std::make_shared<CallbackSink>(*this));
        }

        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }

        for (auto& sink : sinks) {
            sink->set_level(ToSpdlogLevel(minLevel_));
        }

        spdlogger_ = std::make_shared<spdlog::logger>("ascent", sinks.begin(), sinks.end());
        spdlogger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        spdlogger_->set_level(ToSpdlogLevel(minLevel_));
        spdlogger_->flush_on(spdlog::level::warn);

        initialized_ = true;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        spdlogger_.reset();
        return false;
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return;
    }

    if (spdlogger_) {
        spdlogger_->flush();
        spdlogger_.reset();
    }

    initialized_ = false;
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
    if (spdlogger_) {
        spdlogger_->set_level(ToSpdlogLevel(level));
        for (auto& sink : spdlogger_->sinks()) {
            sink->set_level(ToSpdlogLevel(level));
        }
    }
}

LogLevel Logger::GetMinLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return minLevel_;
}

void Logger::SetCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callback_ = std::move(callback);
}

bool Logger::IsLevelEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_ && level >= minLevel_ && level != LogLevel::Off;
}

void Logger::Log(LogLevel level, std::string_view message,
                 const char* file, int line) {
    if (!IsLevelEnabled(level)) {
        CountDropped();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        switch (level) {
            case LogLevel::Trace:    stats_.trace++; break;
            case LogLevel::Debug:    stats_.debug++; break;
            case LogLevel::Info:     stats_.info++; break;
            case LogLevel::Warning:  stats_.warning++; break;
            case LogLevel::Error:    stats_.error++; break;
            case LogLevel::Critical: stats_.critical++; break;
            default: break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!spdlogger_) {
        return;
    }

    std::string formattedMsg;
    if (file && line > 0) {
        // Extract just the filename from the full path
        const char* filename = file;
        for (const char* p = file; *p; ++p) {
            if (*p == '/' || *p == '\\') {
                filename = p + 1;
            }
        }
        formattedMsg = std::string("(") + filename + ":" + std::to_string(line) + ") " + std::string(message);
    } else {
        formattedMsg = std::string(message);
    }

    spdlogger_->log(ToSpdlogLevel(level), formattedMsg);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spdlogger_) {
        spdlogger_->flush();
    }
}

Logger::Statistics Logger::GetStatistics() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

void Logger::ResetStatistics() {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_ = Statistics{};
}

void Logger::CountDropped() {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_.dropped++;
}

void Logger::DispatchCallback(LogLevel level, std::string_view message) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    if (callback_) {
        callback_(level, message, std::chrono::system_clock::now());
    }
}

} // namespace Core
} // namespace Ascent
