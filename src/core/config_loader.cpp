#include "core/config_loader.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>

namespace diarizer {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Positive integer or default with a warning
int readPositiveInt(const nlohmann::json& j, const char* key, int fallback, bool verbose) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j[key];
    if (value.is_number_integer() && value.get<int>() > 0) {
        return value.get<int>();
    }
    if (verbose) {
        LOG_WARN("Config: Invalid {} ({}), using default {}", key, value.dump(), fallback);
    }
    return fallback;
}

std::string readString(const nlohmann::json& j, const char* key, const std::string& fallback,
                       bool verbose) {
    if (!j.contains(key)) {
        return fallback;
    }
    if (j[key].is_string()) {
        return j[key].get<std::string>();
    }
    if (verbose) {
        LOG_WARN("Config: {} must be a string, using default '{}'", key, fallback);
    }
    return fallback;
}

}  // namespace

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_INFO("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        outConfig.endpoint = readString(j, "endpoint", outConfig.endpoint, verbose);
        if (j.contains("workers")) {
            const auto& w = j["workers"];
            if (w.is_number_integer() && w.get<int>() >= 0) {
                outConfig.workers = w.get<int>();
            } else if (verbose) {
                LOG_WARN("Config: Invalid workers ({}), using CPU count", w.dump());
            }
        }
        outConfig.workerExecutable =
            readString(j, "workerExecutable", outConfig.workerExecutable, verbose);
        outConfig.transcoder = readString(j, "transcoder", outConfig.transcoder, verbose);
        outConfig.artifactDir = readString(j, "artifactDir", outConfig.artifactDir, verbose);
        outConfig.uploadDir = readString(j, "uploadDir", outConfig.uploadDir, verbose);
        outConfig.modelPath = readString(j, "modelPath", outConfig.modelPath, verbose);
        outConfig.pidFile = readString(j, "pidFile", outConfig.pidFile, verbose);

        if (j.contains("intraOpThreads")) {
            const auto& t = j["intraOpThreads"];
            if (t.is_number_integer() && t.get<int>() >= 0) {
                outConfig.intraOpThreads = t.get<int>();
            } else if (verbose) {
                LOG_WARN("Config: Invalid intraOpThreads ({}), using 0", t.dump());
            }
        }

        if (j.contains("maxUploadBytes")) {
            const auto& m = j["maxUploadBytes"];
            if (m.is_number_unsigned() && m.get<size_t>() > 0) {
                outConfig.maxUploadBytes = m.get<size_t>();
            } else if (verbose) {
                LOG_WARN("Config: Invalid maxUploadBytes ({}), using default", m.dump());
            }
        }

        if (j.contains("allowedExtensions") && j["allowedExtensions"].is_array()) {
            std::vector<std::string> extensions;
            for (const auto& ext : j["allowedExtensions"]) {
                if (!ext.is_string()) {
                    continue;
                }
                std::string normalized = toLower(ext.get<std::string>());
                if (!normalized.empty() && normalized.front() == '.') {
                    normalized.erase(0, 1);
                }
                if (!normalized.empty()) {
                    extensions.push_back(normalized);
                }
            }
            if (!extensions.empty()) {
                outConfig.allowedExtensions = extensions;
            } else if (verbose) {
                LOG_WARN("Config: allowedExtensions is empty, using defaults");
            }
        }

        if (j.contains("defaults") && j["defaults"].is_object()) {
            const auto& d = j["defaults"];
            if (d.contains("preferAccelerated") && d["preferAccelerated"].is_boolean()) {
                outConfig.defaults.preferAccelerated = d["preferAccelerated"].get<bool>();
            }
            outConfig.defaults.batchSize =
                readPositiveInt(d, "batchSize", outConfig.defaults.batchSize, verbose);
            outConfig.defaults.timeoutSeconds =
                readPositiveInt(d, "timeoutSeconds", outConfig.defaults.timeoutSeconds, verbose);
        }

        if (j.contains("supervisor") && j["supervisor"].is_object()) {
            const auto& s = j["supervisor"];
            outConfig.supervisor.terminateGraceMs = readPositiveInt(
                s, "terminateGraceMs", outConfig.supervisor.terminateGraceMs, verbose);
            outConfig.supervisor.killGraceMs =
                readPositiveInt(s, "killGraceMs", outConfig.supervisor.killGraceMs, verbose);
        }

        if (j.contains("logging")) {
            logging::parseLogConfig(j["logging"], outConfig.logging);
        }

        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}

void resolveRuntimeDefaults(AppConfig& config, unsigned int cpuCount) {
    std::error_code ec;
    const std::string tempDir = std::filesystem::temp_directory_path(ec).string();
    const std::string fallbackDir = ec ? std::string("/tmp") : tempDir;

    if (config.artifactDir.empty()) {
        config.artifactDir = fallbackDir;
    }
    if (config.uploadDir.empty()) {
        config.uploadDir = fallbackDir;
    }
    if (config.workers <= 0) {
        config.workers = cpuCount > 0 ? static_cast<int>(cpuCount) : 1;
    }
}

std::string fileExtension(const std::string& filename) {
    const auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 >= filename.size()) {
        return "";
    }
    const auto slash = filename.find_last_of("/\\");
    if (slash != std::string::npos && slash > dot) {
        return "";
    }
    return toLower(filename.substr(dot + 1));
}

bool isExtensionAllowed(const AppConfig& config, const std::string& filename) {
    const std::string ext = fileExtension(filename);
    if (ext.empty()) {
        return false;
    }
    return std::find(config.allowedExtensions.begin(), config.allowedExtensions.end(), ext) !=
           config.allowedExtensions.end();
}

}  // namespace diarizer
