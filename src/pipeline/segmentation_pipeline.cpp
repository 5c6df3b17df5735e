#include "audio/audio_io.h"
#include "core/error_codes.h"
#include "logging/logger.h"
#include "pipeline/diarization_pipeline.h"
#include "pipeline/powerset_decoder.h"

#include <algorithm>
#include <array>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#ifdef DIARIZER_ENABLE_ORT
#include <onnxruntime_cxx_api.h>
#endif

namespace diarizer {
namespace pipeline {

#ifdef DIARIZER_ENABLE_ORT

namespace {

Ort::Env& ortEnv() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "diarizer");
    return env;
}

std::string statusMessage(OrtStatus* status, const std::string& prefix) {
    std::string message = prefix;
    message += Ort::GetApi().GetErrorMessage(status);
    Ort::GetApi().ReleaseStatus(status);
    return message;
}

bool isProviderAvailable(const std::string& providerName) {
    try {
        std::vector<std::string> providers = Ort::GetAvailableProviders();
        return std::find(providers.begin(), providers.end(), providerName) != providers.end();
    } catch (const Ort::Exception& e) {
        LOG_WARN("Pipeline: failed to query ORT providers: {}", e.what());
        return false;
    }
}

/**
 * @brief Powerset segmentation model run over 10 s chunks.
 *
 * The session is (re)created lazily for the bound device, so to() is cheap
 * and a CPU rebind after a device failure drops all CUDA allocations.
 */
class OrtSegmentationPipeline final : public DiarizationPipeline {
   public:
    explicit OrtSegmentationPipeline(PipelineOptions options) : options_(std::move(options)) {
        if (!std::filesystem::exists(options_.modelPath)) {
            throw FatalWorkerError("segmentation model not found: " + options_.modelPath,
                                   ErrorCode::JOB_BACKEND_UNAVAILABLE);
        }
        createSession();
    }

    const char* name() const override {
        return "ort-segmentation";
    }

    void to(const Device& device) override {
        if (device == device_) {
            return;
        }
        LOG_INFO("Pipeline: rebinding {} -> {}", device_.name(), device.name());
        session_.reset();
        device_ = device;
    }

    void setBatchSize(int batchSize) override {
        batchSize_ = std::max(1, batchSize);
    }

    Annotation run(const std::string& wavPath) override {
        if (!session_) {
            createSession();
        }

        const std::vector<float> samples = AudioIO::readModelInput(wavPath);
        const double duration = static_cast<double>(samples.size()) / SAMPLE_RATE;
        const size_t numChunks = chunkCount(samples.size());
        LOG_INFO("Pipeline: {:.2f}s of audio, {} chunk(s), batch {}, device {}", duration,
                 numChunks, batchSize_, device_.name());

        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);
        const char* inputNames[] = {inputName_.c_str()};
        const char* outputNames[] = {outputName_.c_str()};

        Annotation annotation;
        std::vector<float> batch;
        for (size_t first = 0; first < numChunks; first += static_cast<size_t>(batchSize_)) {
            const size_t count = std::min(static_cast<size_t>(batchSize_), numChunks - first);

            // Zero-padded [count, 1, CHUNK_SAMPLES]
            batch.assign(count * CHUNK_SAMPLES, 0.0f);
            for (size_t i = 0; i < count; ++i) {
                const size_t begin = (first + i) * CHUNK_SAMPLES;
                const size_t end = std::min(begin + CHUNK_SAMPLES, samples.size());
                if (begin < end) {
                    std::copy(samples.begin() + static_cast<std::ptrdiff_t>(begin),
                              samples.begin() + static_cast<std::ptrdiff_t>(end),
                              batch.begin() + static_cast<std::ptrdiff_t>(i * CHUNK_SAMPLES));
                }
            }

            std::array<int64_t, 3> shape{static_cast<int64_t>(count), 1, CHUNK_SAMPLES};
            Ort::Value input = Ort::Value::CreateTensor<float>(memoryInfo, batch.data(),
                                                               batch.size(), shape.data(),
                                                               shape.size());

            Ort::RunOptions runOptions;
            if (device_.isAccelerator()) {
                const std::string arena = "gpu:" + std::to_string(device_.index);
                runOptions.AddConfigEntry("memory.enable_memory_arena_shrinkage", arena.c_str());
            }

            auto outputs = session_->Run(runOptions, inputNames, &input, 1, outputNames, 1);
            if (outputs.empty() || !outputs.front().IsTensor()) {
                throw FatalWorkerError("segmentation model returned no tensor");
            }
            decodeBatch(outputs.front(), first, count, duration, annotation);
        }

        sortAnnotation(annotation);
        return annotation;
    }

   private:
    void createSession() {
        Ort::SessionOptions sessionOptions;
        sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
        if (options_.intraOpThreads > 0) {
            sessionOptions.SetIntraOpNumThreads(options_.intraOpThreads);
        }

        if (device_.kind == DeviceKind::Cuda) {
            if (!isProviderAvailable("CUDAExecutionProvider")) {
                throw FatalWorkerError("CUDAExecutionProvider is not available in this "
                                       "onnxruntime build",
                                       ErrorCode::GPU_INIT_FAILED);
            }
            OrtStatus* status = nullptr;
            // ORT 1.17+ requires provider option struct instead of device id
#if ORT_API_VERSION >= 17
            OrtCUDAProviderOptions cudaOptions{};
            cudaOptions.device_id = device_.index;
            status = Ort::GetApi().SessionOptionsAppendExecutionProvider_CUDA(sessionOptions,
                                                                              &cudaOptions);
#else
            status = Ort::GetApi().SessionOptionsAppendExecutionProvider_CUDA(sessionOptions,
                                                                              device_.index);
#endif
            if (status) {
                throw FatalWorkerError(statusMessage(status, "CUDA provider init failed: "),
                                       ErrorCode::GPU_INIT_FAILED);
            }
        }

        session_ = std::make_unique<Ort::Session>(ortEnv(), options_.modelPath.c_str(),
                                                  sessionOptions);

        Ort::AllocatorWithDefaultOptions allocator;
        if (session_->GetInputCount() == 0 || session_->GetOutputCount() == 0) {
            session_.reset();
            throw FatalWorkerError("segmentation model has no inputs or outputs",
                                   ErrorCode::JOB_BACKEND_UNAVAILABLE);
        }
        inputName_ = session_->GetInputNameAllocated(0, allocator).get();
        outputName_ = session_->GetOutputNameAllocated(0, allocator).get();
        LOG_DEBUG("Pipeline: session ready on {} ({} -> {})", device_.name(), inputName_,
                  outputName_);
    }

    // Output layout [count, frames, NUM_POWERSET_CLASSES]
    void decodeBatch(const Ort::Value& output, size_t firstChunk, size_t count, double duration,
                     Annotation& annotation) const {
        auto info = output.GetTensorTypeAndShapeInfo();
        auto shape = info.GetShape();
        if (shape.size() != 3 || shape[0] != static_cast<int64_t>(count) ||
            shape[2] != NUM_POWERSET_CLASSES || shape[1] <= 0) {
            throw FatalWorkerError("unexpected segmentation output shape");
        }

        const int frames = static_cast<int>(shape[1]);
        const double frameStep = frames == FRAMES_PER_CHUNK ? FRAME_STEP : CHUNK_DURATION / frames;
        const float* data = output.GetTensorData<float>();

        for (size_t i = 0; i < count; ++i) {
            const float* logits = data + i * static_cast<size_t>(frames) * NUM_POWERSET_CLASSES;
            const auto activity = powersetToMultilabel(logits, frames);
            const double offset = static_cast<double>(firstChunk + i) * CHUNK_DURATION;
            auto turns = activityToTurns(activity, frames, frameStep, offset, duration);
            annotation.insert(annotation.end(), turns.begin(), turns.end());
        }
    }

    PipelineOptions options_;
    Device device_ = Device::cpu();
    int batchSize_ = 32;
    std::unique_ptr<Ort::Session> session_;
    std::string inputName_;
    std::string outputName_;
};

}  // namespace

bool pipelineBackendAvailable() {
    return true;
}

std::unique_ptr<DiarizationPipeline> createPipeline(const PipelineOptions& options) {
    try {
        return std::make_unique<OrtSegmentationPipeline>(options);
    } catch (const Ort::Exception& e) {
        throw FatalWorkerError(std::string("failed to load segmentation model: ") + e.what(),
                               ErrorCode::JOB_BACKEND_UNAVAILABLE);
    }
}

#else  // DIARIZER_ENABLE_ORT

bool pipelineBackendAvailable() {
    return false;
}

std::unique_ptr<DiarizationPipeline> createPipeline(const PipelineOptions& /*options*/) {
    throw FatalWorkerError(
        "ONNX Runtime backend is not enabled at build time (rebuild with "
        "DIARIZER_ENABLE_ORT=ON)",
        ErrorCode::JOB_BACKEND_UNAVAILABLE);
}

#endif  // DIARIZER_ENABLE_ORT

}  // namespace pipeline
}  // namespace diarizer
