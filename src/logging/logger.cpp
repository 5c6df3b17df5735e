#include "logging/logger.h"

#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace diarizer {
namespace logging {

namespace {

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum spdlogLevel;
    std::string_view name;
    std::string_view alias;  // accepted by stringToLevel, never printed
};

constexpr std::array<LevelEntry, 7> kLevels = {{
    {LogLevel::Trace, spdlog::level::trace, "trace", "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug", "debug"},
    {LogLevel::Info, spdlog::level::info, "info", "information"},
    {LogLevel::Warn, spdlog::level::warn, "warn", "warning"},
    {LogLevel::Error, spdlog::level::err, "error", "err"},
    {LogLevel::Critical, spdlog::level::critical, "critical", "fatal"},
    {LogLevel::Off, spdlog::level::off, "off", "none"},
}};

const LevelEntry& entryFor(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry;
        }
    }
    return kLevels[2];
}

LogLevel fromSpdlog(spdlog::level::level_enum level) {
    for (const auto& entry : kLevels) {
        if (entry.spdlogLevel == level) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

struct LoggerState {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
    std::atomic<bool> ready{false};
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

// DIARIZER_LOG_LEVEL is inherited by workers, so one export tunes the whole process tree
LogLevel resolveLevel(LogLevel configured) {
    const char* env = std::getenv(LOG_LEVEL_ENV);
    return (env && *env) ? stringToLevel(env) : configured;
}

template <typename Sink>
spdlog::sink_ptr makeConsoleSink(bool colored) {
    auto sink = std::make_shared<Sink>();
    if (!colored) {
        sink->set_color_mode(spdlog::color_mode::never);
    }
    return sink;
}

std::vector<spdlog::sink_ptr> buildSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.consoleOutput) {
        sinks.push_back(config.useStderr
                            ? makeConsoleSink<spdlog::sinks::stderr_color_sink_mt>(
                                  config.coloredOutput)
                            : makeConsoleSink<spdlog::sinks::stdout_color_sink_mt>(
                                  config.coloredOutput));
    }
    if (!config.filePath.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups));
    }
    return sinks;
}

template <typename T>
void readKey(const nlohmann::json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end()) {
        target = it->get<T>();
    }
}

}  // namespace

bool initialize(const LogConfig& config) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    const LogLevel level = resolveLevel(config.level);

    if (s.ready.load(std::memory_order_acquire) && s.logger) {
        s.logger->set_level(entryFor(level).spdlogLevel);
        s.logger->set_pattern(config.pattern);
        return true;
    }

    try {
        auto sinks = buildSinks(config);
        s.logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
        s.logger->set_level(entryFor(level).spdlogLevel);
        s.logger->set_pattern(config.pattern);
        s.logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(s.logger);
        s.ready.store(true, std::memory_order_release);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << config.name << ": cannot set up logging: " << ex.what() << std::endl;
        return false;
    }

    LOG_DEBUG("Logging at level {}", entryFor(level).name);
    if (!config.filePath.empty()) {
        LOG_INFO("Logging to {} (rotates at {} KiB, keeps {})", config.filePath,
                 config.maxFileSize / 1024, config.maxBackups);
    }
    return true;
}

bool initializeEarly(const std::string& name) {
    LogConfig config;
    config.name = name;
    config.useStderr = true;
    return initialize(config);
}

void parseLogConfig(const nlohmann::json& section, LogConfig& config) {
    if (!section.is_object()) {
        return;
    }
    std::string levelName;
    readKey(section, "level", levelName);
    if (!levelName.empty()) {
        config.level = stringToLevel(levelName);
    }
    readKey(section, "filePath", config.filePath);
    readKey(section, "maxFileSize", config.maxFileSize);
    readKey(section, "maxBackups", config.maxBackups);
    readKey(section, "consoleOutput", config.consoleOutput);
    readKey(section, "coloredOutput", config.coloredOutput);
    readKey(section, "pattern", config.pattern);
}

bool initializeFromConfig(const std::string& configPath, const std::string& name) {
    LogConfig config;
    config.name = name;

    std::ifstream file(configPath);
    if (file) {
        try {
            const auto document = nlohmann::json::parse(file);
            auto it = document.find("logging");
            if (it != document.end()) {
                parseLogConfig(*it, config);
            }
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << name << ": ignoring logging section of " << configPath << ": "
                      << ex.what() << std::endl;
        }
    }
    return initialize(config);
}

void shutdown() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.logger) {
        s.logger->flush();
    }
    s.ready.store(false, std::memory_order_release);
    spdlog::shutdown();
    s.logger.reset();
}

void setLevel(LogLevel level) {
    auto logger = state().logger;
    if (!logger) {
        return;
    }
    logger->set_level(entryFor(level).spdlogLevel);
    LOG_INFO("Log level is now {}", entryFor(level).name);
}

LogLevel getLevel() {
    auto logger = state().logger;
    return logger ? fromSpdlog(logger->level()) : LogLevel::Info;
}

void flush() {
    if (auto logger = state().logger) {
        logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    auto& s = state();
    if (!s.ready.load(std::memory_order_acquire)) {
        initialize();
    }
    return s.logger;
}

std::string_view levelToString(LogLevel level) {
    return entryFor(level).name;
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower(str.size(), '\0');
    for (size_t i = 0; i < str.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(str[i])));
    }
    for (const auto& entry : kLevels) {
        if (lower == entry.name || lower == entry.alias) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace diarizer
