#include "core/config_loader.h"
#include "core/daemon_constants.h"
#include "daemon/daemon_options.h"
#include "daemon/graceful_shutdown.h"
#include "daemon/host_capabilities.h"
#include "daemon/pid_lock.h"
#include "job/process_supervisor.h"
#include "logging/logger.h"
#include "service/diarize_handler.h"
#include "service/zmq_server.h"

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <thread>
#include <unistd.h>

using namespace diarizer;

namespace {

constexpr auto kSignalPollInterval = std::chrono::milliseconds(100);

// Prefer a worker binary installed next to diarizerd; otherwise leave it to PATH lookup
std::string resolveWorkerExecutable(const std::string& configured) {
    if (configured.find('/') != std::string::npos) {
        return configured;
    }
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        auto sibling = self.parent_path() / configured;
        if (access(sibling.c_str(), X_OK) == 0) {
            return sibling.string();
        }
    }
    return configured;
}

bool ensureDirectory(const std::string& path, const char* what) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        LOG_ERROR("Cannot create {} directory {}: {}", what, path, ec.message());
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = daemon_core::parseDaemonOptions(argc, argv);
    if (parsed.showHelp) {
        daemon_core::printDaemonHelp(argv[0]);
        return 0;
    }
    if (parsed.showVersion) {
        std::cout << "diarizerd " << DaemonConstants::VERSION << std::endl;
        return 0;
    }
    if (parsed.hasError || !parsed.options) {
        std::cerr << "diarizerd: " << parsed.errorMessage << std::endl;
        daemon_core::printDaemonHelp(argv[0]);
        return 64;
    }
    const daemon_core::DaemonOptions& options = *parsed.options;

    logging::initializeEarly("diarizerd");

    if (!GracefulShutdown::installSignalHandlers()) {
        LOG_CRITICAL("Cannot install signal handlers");
        return 1;
    }

    GracefulShutdown::Controller controller;
    controller.setSignalState(&GracefulShutdown::getGlobalSignalState());
    controller.setLogCallback([](const char* message) { LOG_INFO("{}", message); });

    const std::string configPath =
        options.configPath.empty() ? DEFAULT_CONFIG_FILE : options.configPath;
    std::optional<daemon_core::PidLock> pidLock;
    bool reload = false;

    try {
        do {
            AppConfig config;
            const bool configLoaded = loadAppConfig(configPath, config);
            if (!configLoaded) {
                LOG_WARN("Config {} not loaded, using defaults", configPath);
            }
            if (!options.endpoint.empty()) {
                config.endpoint = options.endpoint;
            }
            if (!options.pidFile.empty()) {
                config.pidFile = options.pidFile;
            }

            logging::shutdown();
            logging::initialize(config.logging);

            const unsigned int cpus = std::thread::hardware_concurrency();
            resolveRuntimeDefaults(config, cpus > 0 ? cpus : 1);

            if (!config.pidFile.empty() && (!pidLock || pidLock->path() != config.pidFile)) {
                pidLock.reset();
                pidLock = daemon_core::PidLock::tryAcquire(config.pidFile);
                if (!pidLock) {
                    return 1;
                }
            } else if (config.pidFile.empty()) {
                pidLock.reset();
            }

            if (!ensureDirectory(config.artifactDir, "artifact") ||
                !ensureDirectory(config.uploadDir, "upload")) {
                return 1;
            }

            std::vector<std::string> workerCommand = {
                resolveWorkerExecutable(config.workerExecutable)};
            if (configLoaded) {
                workerCommand.push_back("--config");
                workerCommand.push_back(std::filesystem::absolute(configPath).string());
            }

            auto capabilities = daemon_core::probeHostCapabilities(workerCommand);
            if (!capabilities.backendAvailable) {
                LOG_WARN("Worker {} reports no pipeline backend; DIARIZE will answer 503",
                         workerCommand.front());
            }

            job::SupervisorConfig supervisorConfig;
            supervisorConfig.workerCommand = workerCommand;
            supervisorConfig.artifactDir = config.artifactDir;
            supervisorConfig.terminateGrace =
                std::chrono::milliseconds(config.supervisor.terminateGraceMs);
            supervisorConfig.killGrace = std::chrono::milliseconds(config.supervisor.killGraceMs);
            job::ProcessSupervisor supervisor(supervisorConfig);

            daemon_ipc::ZmqCommandServer server(config.endpoint, config.workers);
            daemon_ipc::DiarizeHandler handler(
                config, capabilities,
                [&supervisor](const job::JobRequest& request) {
                    return supervisor.execute(request);
                });
            handler.registerWith(server);

            if (!server.start()) {
                LOG_CRITICAL("Cannot start command server on {}", config.endpoint);
                return 1;
            }
            LOG_INFO("diarizerd {} listening on {} (events on {}), {} worker thread(s)",
                     DaemonConstants::VERSION, server.endpoint(), server.pubEndpoint(),
                     server.workerThreads());

            controller.clearReloadRequest();
            controller.setRunning(true);
            controller.setStopCallback([&server]() { server.stop(); });

            while (controller.isRunning()) {
                if (!controller.processPendingSignals()) {
                    std::this_thread::sleep_for(kSignalPollInterval);
                }
            }

            controller.setStopCallback({});
            server.stop();
            reload = controller.isReloadRequested();
            if (reload) {
                LOG_INFO("Reloading configuration from {}", configPath);
            }
        } while (reload);
    } catch (const std::exception& e) {
        LOG_CRITICAL("diarizerd: {}", e.what());
        logging::shutdown();
        return 1;
    }

    LOG_INFO("diarizerd stopped");
    logging::shutdown();
    return 0;
}
