#pragma once

/// @file logging.h
/// @brief chartcalc logging on top of spdlog

#include <memory>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

// Compile every level in; SetLogLevel() decides what is emitted
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace chartcalc {

enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logger setup
struct LogConfig {
    std::string name = "chartcalc";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    // Rotating file sink, off unless file_path is set
    std::string file_path;
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
};

/// @brief Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Initialize the process logger; only the first call takes effect
void InitLogging(const LogConfig& config = {});

/// @brief Process logger, initialized with defaults on first use
std::shared_ptr<spdlog::logger> GetLogger();

void SetLogLevel(LogLevel level);

void FlushLogs();

void ShutdownLogging();

#define CHARTCALC_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::chartcalc::GetLogger(), __VA_ARGS__)
#define CHARTCALC_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::chartcalc::GetLogger(), __VA_ARGS__)
#define CHARTCALC_LOG_INFO(...) SPDLOG_LOGGER_INFO(::chartcalc::GetLogger(), __VA_ARGS__)
#define CHARTCALC_LOG_WARN(...) SPDLOG_LOGGER_WARN(::chartcalc::GetLogger(), __VA_ARGS__)
#define CHARTCALC_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::chartcalc::GetLogger(), __VA_ARGS__)

}  // namespace chartcalc
