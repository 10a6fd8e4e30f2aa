#pragma once

/// @file logging.h
/// @brief ReviewScope logging on top of spdlog

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace reviewscope {

enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logger settings, usually filled from the `logging` section of the
/// YAML configuration
struct LogConfig {
    std::string name = "reviewscope";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    /// Write to stderr instead of stdout so reports can be piped
    bool use_stderr = true;

    bool enable_file = false;
    std::string file_path = "reviewscope.log";
    size_t max_file_size = 5 * 1024 * 1024;  // 5 MB
    size_t max_files = 3;
};

/// @brief Initialize the process logger. Later calls are ignored.
void InitLogging(const LogConfig& config = {});

/// @brief Get the process logger, initializing it with defaults if needed
std::shared_ptr<spdlog::logger> GetLogger();

void SetLogLevel(LogLevel level);

/// @brief Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
/// @return Parsed level, or `fallback` for unrecognized input
LogLevel LogLevelFromString(std::string_view name, LogLevel fallback = LogLevel::kInfo);

void FlushLogs();

void ShutdownLogging();

#define REVIEWSCOPE_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::reviewscope::GetLogger(), __VA_ARGS__)
#define REVIEWSCOPE_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::reviewscope::GetLogger(), __VA_ARGS__)
#define REVIEWSCOPE_LOG_INFO(...) SPDLOG_LOGGER_INFO(::reviewscope::GetLogger(), __VA_ARGS__)
#define REVIEWSCOPE_LOG_WARN(...) SPDLOG_LOGGER_WARN(::reviewscope::GetLogger(), __VA_ARGS__)
#define REVIEWSCOPE_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::reviewscope::GetLogger(), __VA_ARGS__)
#define REVIEWSCOPE_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::reviewscope::GetLogger(), __VA_ARGS__)

}  // namespace reviewscope
