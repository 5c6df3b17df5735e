#pragma once

#include "pipeline/diarization_pipeline.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace diarizer {
namespace pipeline {

// Segmentation model geometry (pyannote segmentation-3.0 layout)
constexpr int SAMPLE_RATE = 16000;
constexpr int CHUNK_SAMPLES = 160000;  // 10 s at 16 kHz
constexpr double CHUNK_DURATION = 10.0;
constexpr int FRAMES_PER_CHUNK = 589;
constexpr double FRAME_STEP = 0.016875;  // seconds
constexpr int NUM_POWERSET_CLASSES = 7;
constexpr int NUM_LOCAL_SPEAKERS = 3;

// Number of non-overlapping chunks covering numSamples (at least 1)
size_t chunkCount(size_t numSamples);

/**
 * @brief Argmax over powerset logits, expanded to per-speaker activity.
 *
 * Class order: {}, {0}, {1}, {2}, {0,1}, {0,2}, {1,2}.
 *
 * @param logits   numFrames x NUM_POWERSET_CLASSES, frame-major
 * @return numFrames x NUM_LOCAL_SPEAKERS activity flags, frame-major
 */
std::vector<uint8_t> powersetToMultilabel(const float* logits, int numFrames);

/**
 * @brief Merge consecutive active frames of each local speaker into turns.
 *
 * @param activity     numFrames x NUM_LOCAL_SPEAKERS flags
 * @param frameStep    seconds per frame
 * @param offset       chunk start in seconds
 * @param limit        end of real audio in seconds; turns are clipped to it
 * @return turns labelled SPEAKER_00.. SPEAKER_02, ordered by start
 */
Annotation activityToTurns(const std::vector<uint8_t>& activity, int numFrames, double frameStep,
                           double offset, double limit);

std::string speakerLabel(int index);

// Sort by (start, end, label)
void sortAnnotation(Annotation& annotation);

}  // namespace pipeline
}  // namespace diarizer
