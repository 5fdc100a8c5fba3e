#include "logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace chartcalc {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> CreateLogger(const LogConfig& config) {
    const auto level = static_cast<spdlog::level::level_enum>(config.level);
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);
    sinks.push_back(console_sink);

    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size, config.max_files);
        file_sink->set_level(level);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(name);
    if (lower == "trace") return LogLevel::kTrace;
    if (lower == "debug") return LogLevel::kDebug;
    if (lower == "info") return LogLevel::kInfo;
    if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
    if (lower == "error") return LogLevel::kError;
    if (lower == "critical") return LogLevel::kCritical;
    if (lower == "off") return LogLevel::kOff;
    return absl::InvalidArgumentError(absl::StrCat("Unknown log level: ", name));
}

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        return;
    }
    g_logger = CreateLogger(config);
    spdlog::set_default_logger(g_logger);
}

std::shared_ptr<spdlog::logger> GetLogger() {
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (g_logger) {
            return g_logger;
        }
    }
    InitLogging();
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        return;
    }
    const auto spd_level = static_cast<spdlog::level::level_enum>(level);
    g_logger->set_level(spd_level);
    for (auto& sink : g_logger->sinks()) {
        sink->set_level(spd_level);
    }
}

void FlushLogs() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

}  // namespace chartcalc
