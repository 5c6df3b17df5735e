#include "core/config_loader.h"
#include "core/error_codes.h"
#include "logging/logger.h"
#include "pipeline/diarization_pipeline.h"
#include "worker/worker_entry.h"
#include "worker/worker_options.h"

#include <filesystem>
#include <iostream>

using namespace diarizer;

int main(int argc, char* argv[]) {
    auto parsed = worker::parseWorkerOptions(argc, argv);
    if (parsed.showHelp) {
        worker::printWorkerHelp(argv[0]);
        return 0;
    }
    if (parsed.hasError || !parsed.options) {
        std::cerr << "diarizer_worker: " << parsed.errorMessage << std::endl;
        worker::printWorkerHelp(argv[0]);
        return worker::EXIT_USAGE;
    }
    const worker::WorkerOptions& options = *parsed.options;

    AppConfig config;
    std::string configPath = options.configPath;
    if (configPath.empty() && std::filesystem::exists(DEFAULT_CONFIG_FILE)) {
        configPath = DEFAULT_CONFIG_FILE;
    }
    // Logging first with defaults so config problems are reported
    logging::initializeEarly("diarizer_worker");
    if (!configPath.empty() && !loadAppConfig(configPath, config)) {
        LOG_WARN("Worker: could not load {}, using defaults", configPath);
    }
    config.logging.name = "diarizer_worker";
    config.logging.useStderr = true;
    config.logging.filePath.clear();  // the daemon owns the log file
    logging::initialize(config.logging);

    if (options.checkOnly) {
        if (!pipeline::pipelineBackendAvailable()) {
            std::cout << "backend: unavailable (built without ONNX Runtime)" << std::endl;
            return 1;
        }
        if (!std::filesystem::exists(config.modelPath)) {
            std::cout << "backend: unavailable (model not found: " << config.modelPath << ")"
                      << std::endl;
            return 1;
        }
        std::cout << "backend: available" << std::endl;
        return 0;
    }

    pipeline::PipelineOptions pipelineOptions;
    pipelineOptions.modelPath = config.modelPath;
    pipelineOptions.intraOpThreads = config.intraOpThreads;

    worker::WorkerDependencies deps;
    deps.probe = worker::createAcceleratorProbe();
    deps.pipelineFactory = [pipelineOptions]() { return pipeline::createPipeline(pipelineOptions); };
    deps.transcoder = std::make_shared<worker::FfmpegTranscoder>(config.transcoder);
    deps.cache = worker::createDeviceCache();

    worker::WorkerEntry entry(std::move(deps));
    const int exitCode = entry.run(options.job);
    logging::shutdown();
    return exitCode;
}
