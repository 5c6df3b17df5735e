/**
 * @file test_audio_io.cpp
 * @brief Unit tests for reading the converted model input
 */

#include "audio/audio_io.h"
#include "core/error_codes.h"
#include "helpers/temp_dir.h"

#include <fstream>
#include <gtest/gtest.h>
#include <sndfile.h>
#include <string>
#include <vector>

using namespace diarizer;

namespace {

void writeWav(const std::string& path, int sampleRate, int channels,
              const std::vector<float>& interleaved) {
    SF_INFO info{};
    info.samplerate = sampleRate;
    info.channels = channels;
    info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;
    SNDFILE* file = sf_open(path.c_str(), SFM_WRITE, &info);
    ASSERT_NE(file, nullptr) << sf_strerror(nullptr);
    sf_writef_float(file, interleaved.data(),
                    static_cast<sf_count_t>(interleaved.size()) / channels);
    sf_close(file);
}

}  // namespace

// ============================================================
// readModelInput
// ============================================================

TEST(AudioIO, ReadsSixteenKilohertzMono) {
    test::TempDir dir;
    const std::string path = (dir.path() / "in.16k.wav").string();
    writeWav(path, 16000, 1, {0.0f, 0.25f, -0.5f, 0.75f});

    const auto samples = AudioIO::readModelInput(path);
    ASSERT_EQ(samples.size(), 4u);
    EXPECT_FLOAT_EQ(samples[1], 0.25f);
    EXPECT_FLOAT_EQ(samples[2], -0.5f);
}

TEST(AudioIO, RejectsWrongRateOrChannels) {
    test::TempDir dir;
    const std::string stereo = (dir.path() / "stereo.wav").string();
    writeWav(stereo, 16000, 2, {0.1f, 0.1f, 0.2f, 0.2f});
    EXPECT_THROW(AudioIO::readModelInput(stereo), FatalWorkerError);

    const std::string cdRate = (dir.path() / "cd.wav").string();
    writeWav(cdRate, 44100, 1, {0.1f, 0.2f});
    EXPECT_THROW(AudioIO::readModelInput(cdRate), FatalWorkerError);
}

TEST(AudioIO, MissingOrUnreadableFileIsFatal) {
    test::TempDir dir;
    EXPECT_THROW(AudioIO::readModelInput((dir.path() / "absent.wav").string()), FatalWorkerError);

    const std::string text = (dir.path() / "notes.wav").string();
    std::ofstream(text) << "not audio";
    EXPECT_THROW(AudioIO::readModelInput(text), FatalWorkerError);
}
