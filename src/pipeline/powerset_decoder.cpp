#include "pipeline/powerset_decoder.h"

#include <algorithm>
#include <array>
#include <cstdio>
#include <stdexcept>
#include <tuple>

namespace diarizer {
namespace pipeline {

namespace {

// Powerset class -> active local speakers
constexpr std::array<std::array<uint8_t, NUM_LOCAL_SPEAKERS>, NUM_POWERSET_CLASSES> kPowerset = {{
    {0, 0, 0},
    {1, 0, 0},
    {0, 1, 0},
    {0, 0, 1},
    {1, 1, 0},
    {1, 0, 1},
    {0, 1, 1},
}};

}  // namespace

size_t chunkCount(size_t numSamples) {
    if (numSamples <= static_cast<size_t>(CHUNK_SAMPLES)) {
        return 1;
    }
    return (numSamples + CHUNK_SAMPLES - 1) / CHUNK_SAMPLES;
}

std::vector<uint8_t> powersetToMultilabel(const float* logits, int numFrames) {
    if (numFrames < 0) {
        throw std::invalid_argument("powersetToMultilabel: negative frame count");
    }
    std::vector<uint8_t> activity(static_cast<size_t>(numFrames) * NUM_LOCAL_SPEAKERS, 0);
    for (int f = 0; f < numFrames; ++f) {
        const float* row = logits + static_cast<size_t>(f) * NUM_POWERSET_CLASSES;
        int best = 0;
        for (int c = 1; c < NUM_POWERSET_CLASSES; ++c) {
            if (row[c] > row[best]) {
                best = c;
            }
        }
        for (int s = 0; s < NUM_LOCAL_SPEAKERS; ++s) {
            activity[static_cast<size_t>(f) * NUM_LOCAL_SPEAKERS + s] = kPowerset[best][s];
        }
    }
    return activity;
}

Annotation activityToTurns(const std::vector<uint8_t>& activity, int numFrames, double frameStep,
                           double offset, double limit) {
    if (activity.size() < static_cast<size_t>(numFrames) * NUM_LOCAL_SPEAKERS) {
        throw std::invalid_argument("activityToTurns: activity buffer too small");
    }

    Annotation turns;
    for (int s = 0; s < NUM_LOCAL_SPEAKERS; ++s) {
        int runStart = -1;
        for (int f = 0; f <= numFrames; ++f) {
            const bool active =
                f < numFrames && activity[static_cast<size_t>(f) * NUM_LOCAL_SPEAKERS + s] != 0;
            if (active && runStart < 0) {
                runStart = f;
            } else if (!active && runStart >= 0) {
                const double start = offset + runStart * frameStep;
                const double end = std::min(offset + f * frameStep, limit);
                if (end > start) {
                    turns.push_back(Turn{start, end, speakerLabel(s)});
                }
                runStart = -1;
            }
        }
    }
    sortAnnotation(turns);
    return turns;
}

std::string speakerLabel(int index) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "SPEAKER_%02d", index);
    return buffer;
}

void sortAnnotation(Annotation& annotation) {
    std::sort(annotation.begin(), annotation.end(), [](const Turn& a, const Turn& b) {
        return std::tie(a.start, a.end, a.label) < std::tie(b.start, b.end, b.label);
    });
}

}  // namespace pipeline
}  // namespace diarizer
