#include "worker/worker_options.h"

#include <cstdlib>
#include <iostream>

namespace diarizer {
namespace worker {

namespace {

std::optional<int> parsePositiveInt(std::string_view value) {
    const std::string buffer{value};
    char* end = nullptr;
    long parsed = std::strtol(buffer.c_str(), &end, 10);
    if (buffer.empty() || !end || *end != '\0' || parsed <= 0 || parsed > 1 << 20) {
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

}  // namespace

void printWorkerHelp(std::string_view programName) {
    std::cout << "Usage: " << programName
              << " --input <audio> --output <result.json> [options]\n"
              << "       " << programName << " --check\n\n"
              << "Options:\n"
              << "  --device <accelerated|cpu>  Device preference (default: accelerated)\n"
              << "  --batch-size <n>            Chunks per inference call on the accelerator\n"
              << "  --config <path>             JSON config (model path, transcoder, logging)\n"
              << "  --check                     Exit 0 if the pipeline backend is built in\n"
              << "  -h, --help                  Show this help\n";
}

ParseWorkerOptionsResult parseWorkerOptions(int argc, char** argv) {
    WorkerOptions opt{};
    ParseWorkerOptionsResult result{};

    auto fail = [&](const std::string& message) {
        result.hasError = true;
        result.errorMessage = message;
        return result;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "-h" || arg == "--help") {
            result.showHelp = true;
            return result;
        } else if (arg == "--check") {
            opt.checkOnly = true;
        } else if (arg == "--input" && i + 1 < argc) {
            opt.job.inputPath = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            opt.job.outputPath = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            const std::string_view device{argv[++i]};
            if (device == "accelerated" || device == "gpu" || device == "cuda") {
                opt.job.preferAccelerated = true;
            } else if (device == "cpu") {
                opt.job.preferAccelerated = false;
            } else {
                return fail("Unsupported device. Use one of: accelerated | cpu");
            }
        } else if (arg == "--batch-size" && i + 1 < argc) {
            auto parsed = parsePositiveInt(argv[++i]);
            if (!parsed) {
                return fail("--batch-size must be a positive integer");
            }
            opt.job.batchSize = *parsed;
        } else if (arg == "--config" && i + 1 < argc) {
            opt.configPath = argv[++i];
        } else {
            return fail("Unknown or incomplete option: " + std::string(arg));
        }
    }

    if (!opt.checkOnly && (opt.job.inputPath.empty() || opt.job.outputPath.empty())) {
        return fail("--input and --output are required");
    }

    result.options = opt;
    return result;
}

}  // namespace worker
}  // namespace diarizer
