/**
 * @file logger.h
 * @brief Logging API shared by diarizerd and diarizer_worker
 *
 * Thin wrapper around spdlog. The daemon and every worker process call
 * one of the initialize functions once; the PID is part of the default
 * pattern so interleaved daemon/worker output stays attributable.
 */

#pragma once

#include <atomic>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace diarizer {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

// Environment variable that overrides the configured level in every process
constexpr const char* LOG_LEVEL_ENV = "DIARIZER_LOG_LEVEL";

/**
 * @brief Logging configuration
 */
struct LogConfig {
    std::string name = "diarizerd";  // Logger name shown in %n
    LogLevel level = LogLevel::Info;
    std::string filePath = "";  // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);  // 10 MB
    size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    bool useStderr = false;  // Workers log to stderr only
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n:%P] [%^%l%$] %v";
};

/**
 * @brief Initialize the logging system
 *
 * Calling it again replaces level and pattern of the existing logger.
 * DIARIZER_LOG_LEVEL, when set, wins over config.level.
 *
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with stderr output only
 *
 * Used before the config file is read, and by worker processes.
 */
bool initializeEarly(const std::string& name = "diarizerd");

/**
 * @brief Read the "logging" object of a config document into config.
 *
 * Missing keys keep their current value.
 */
void parseLogConfig(const nlohmann::json& section, LogConfig& config);

/**
 * @brief Initialize logging from the "logging" section of a JSON config file
 *
 * Falls back to defaults if the file or section is missing.
 */
bool initializeFromConfig(const std::string& configPath, const std::string& name = "diarizerd");

void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

/**
 * @brief Get the underlying spdlog logger (initializes with defaults on first use)
 */
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Convert string to LogLevel (case-insensitive, defaults to Info)
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace diarizer

#include <spdlog/spdlog.h>

#define DIARIZER_LOG_IMPL(macro, ...)                  \
    do {                                               \
        auto logger = diarizer::logging::getLogger();  \
        if (logger)                                    \
            macro(logger, __VA_ARGS__);                \
    } while (0)

#define LOG_TRACE(...) DIARIZER_LOG_IMPL(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) DIARIZER_LOG_IMPL(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) DIARIZER_LOG_IMPL(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) DIARIZER_LOG_IMPL(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) DIARIZER_LOG_IMPL(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) DIARIZER_LOG_IMPL(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

/**
 * @brief Log at most once per call site for the life of the process
 */
#define LOG_ONCE(level, ...)                                                  \
    do {                                                                      \
        static std::atomic<bool> diarizerLoggedOnce{false};                   \
        if (!diarizerLoggedOnce.exchange(true, std::memory_order_relaxed)) {  \
            LOG_##level(__VA_ARGS__);                                         \
        }                                                                     \
    } while (0)
