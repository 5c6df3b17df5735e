#include "audio/audio_io.h"

#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <cstring>
#include <string>
#include <utility>

namespace AudioIO {

WavReader::WavReader() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

WavReader::~WavReader() {
    close();
}

bool WavReader::open(const std::string& filename) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    file_ = sf_open(filename.c_str(), SFM_READ, &info_);
    if (!file_) {
        LOG_ERROR("Error opening input file {}: {}", filename, sf_strerror(nullptr));
        return false;
    }

    LOG_DEBUG("Opened {}: {} Hz, {} ch, {} frames ({:.2f}s)", filename, info_.samplerate,
              info_.channels, info_.frames,
              info_.samplerate > 0 ? static_cast<double>(info_.frames) / info_.samplerate : 0.0);
    return true;
}

void WavReader::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

bool WavReader::readAll(AudioFile& output) {
    if (!file_) {
        LOG_ERROR("WavReader: file not opened");
        return false;
    }

    output.sampleRate = info_.samplerate;
    output.channels = info_.channels;
    output.frames = info_.frames;
    output.data.resize(static_cast<size_t>(info_.frames) * static_cast<size_t>(info_.channels));

    sf_count_t framesRead = sf_readf_float(file_, output.data.data(), info_.frames);
    if (framesRead != info_.frames) {
        LOG_ERROR("WavReader: incomplete read, expected {} frames, read {}", info_.frames,
                  framesRead);
        return false;
    }
    return true;
}

std::vector<float> readModelInput(const std::string& filename) {
    WavReader reader;
    if (!reader.open(filename)) {
        throw diarizer::FatalWorkerError("cannot open converted audio " + filename);
    }
    if (reader.getSampleRate() != DaemonConstants::MODEL_SAMPLE_RATE ||
        reader.getChannels() != DaemonConstants::MODEL_CHANNELS) {
        throw diarizer::FatalWorkerError(
            "converted audio must be " + std::to_string(DaemonConstants::MODEL_SAMPLE_RATE) +
            " Hz mono, got " + std::to_string(reader.getSampleRate()) + " Hz / " +
            std::to_string(reader.getChannels()) + " ch");
    }

    AudioFile audio;
    if (!reader.readAll(audio)) {
        throw diarizer::FatalWorkerError("failed to read converted audio " + filename);
    }
    return std::move(audio.data);
}

}  // namespace AudioIO
