#pragma once

#include "core/error_codes.h"
#include "worker/device_selector.h"
#include "worker/execution_wrapper.h"
#include "worker/transcoder.h"

#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace diarizer {
namespace test {

class FakeProbe : public worker::AcceleratorProbe {
   public:
    bool isAvailable = true;
    bool failSelfTest = false;
    int selfTests = 0;

    bool available() override {
        return isAvailable;
    }
    Device device() const override {
        return Device::cuda(0);
    }
    void selfTest() override {
        ++selfTests;
        if (failSelfTest) {
            throw std::runtime_error("CUDA error: device-side assert triggered");
        }
    }
};

// Records every call; run() replays scripted results per device kind
class FakePipeline : public pipeline::DiarizationPipeline {
   public:
    using RunFn = std::function<pipeline::Annotation(const Device&, const std::string&)>;

    explicit FakePipeline(RunFn fn) : fn_(std::move(fn)) {}

    const char* name() const override {
        return "fake";
    }
    void to(const Device& device) override {
        device_ = device;
        devices.push_back(device);
    }
    void setBatchSize(int batchSize) override {
        batchSizes.push_back(batchSize);
    }
    pipeline::Annotation run(const std::string& wavPath) override {
        inputs.push_back(wavPath);
        return fn_(device_, wavPath);
    }

    std::vector<Device> devices;
    std::vector<int> batchSizes;
    std::vector<std::string> inputs;

   private:
    RunFn fn_;
    Device device_ = Device::cpu();
};

class CountingCache : public worker::DeviceCache {
   public:
    void clear(const Device& device) override {
        cleared.push_back(device);
    }
    std::vector<Device> cleared;
};

// Writes a placeholder file at output, or fails like a converter exiting non-zero
class FakeTranscoder : public worker::Transcoder {
   public:
    bool fail = false;
    std::vector<std::string> outputs;

    void convert(const std::string& input, const std::string& output) override {
        outputs.push_back(output);
        if (fail) {
            throw TranscodeError("ffmpeg failed on " + input + " (exit code 1)");
        }
        std::ofstream(output) << "RIFF";
    }
};

}  // namespace test
}  // namespace diarizer
