#ifndef AUDIO_IO_H
#define AUDIO_IO_H

#include <sndfile.h>
#include <string>
#include <vector>

namespace AudioIO {

struct AudioFile {
    std::vector<float> data;  // Interleaved samples
    int sampleRate = 0;
    int channels = 0;
    sf_count_t frames = 0;

    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(frames) / sampleRate : 0.0;
    }
};

class WavReader {
   public:
    WavReader();
    ~WavReader();

    WavReader(const WavReader&) = delete;
    WavReader& operator=(const WavReader&) = delete;

    bool open(const std::string& filename);
    void close();

    int getSampleRate() const {
        return info_.samplerate;
    }
    int getChannels() const {
        return info_.channels;
    }
    sf_count_t getFrames() const {
        return info_.frames;
    }

    bool readAll(AudioFile& output);

   private:
    SNDFILE* file_;
    SF_INFO info_;
};

/**
 * @brief Read a transcoded file as mono samples at the model rate.
 *
 * @throws diarizer::FatalWorkerError if the file cannot be read or is not
 *         16 kHz mono (the transcoder guarantees both)
 */
std::vector<float> readModelInput(const std::string& filename);

}  // namespace AudioIO

#endif  // AUDIO_IO_H
