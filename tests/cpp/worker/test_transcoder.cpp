/**
 * @file test_transcoder.cpp
 * @brief External converter invocation, judged by exit code only
 */

#include "core/error_codes.h"
#include "worker/transcoder.h"

#include <algorithm>
#include <gtest/gtest.h>

using namespace diarizer;

TEST(FfmpegTranscoder, CommandLine) {
    worker::FfmpegTranscoder transcoder("/usr/bin/ffmpeg");
    auto cmd = transcoder.buildCommand("in.mp3", "out.16k.wav");
    ASSERT_FALSE(cmd.empty());
    EXPECT_EQ(cmd.front(), "/usr/bin/ffmpeg");
    EXPECT_EQ(cmd.back(), "out.16k.wav");

    auto valueAfter = [&cmd](const std::string& flag) {
        for (size_t i = 0; i + 1 < cmd.size(); ++i) {
            if (cmd[i] == flag) {
                return cmd[i + 1];
            }
        }
        return std::string();
    };
    EXPECT_EQ(valueAfter("-i"), "in.mp3");
    EXPECT_EQ(valueAfter("-ar"), "16000");
    EXPECT_EQ(valueAfter("-ac"), "1");
    EXPECT_EQ(valueAfter("-f"), "wav");
    EXPECT_NE(std::find(cmd.begin(), cmd.end(), "-y"), cmd.end());
    EXPECT_NE(std::find(cmd.begin(), cmd.end(), "-nostdin"), cmd.end());
}

TEST(FfmpegTranscoder, ZeroExitIsSuccess) {
    worker::FfmpegTranscoder transcoder("true");
    EXPECT_NO_THROW(transcoder.convert("in.mp3", "out.wav"));
}

TEST(FfmpegTranscoder, NonZeroExitThrows) {
    worker::FfmpegTranscoder transcoder("false");
    try {
        transcoder.convert("in.mp3", "out.wav");
        FAIL() << "expected TranscodeError";
    } catch (const TranscodeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::JOB_TRANSCODE_FAILED);
        EXPECT_NE(std::string(e.what()).find("in.mp3"), std::string::npos);
    }
}

TEST(FfmpegTranscoder, MissingExecutableThrows) {
    worker::FfmpegTranscoder transcoder("/nonexistent/ffmpeg");
    EXPECT_THROW(transcoder.convert("in.mp3", "out.wav"), TranscodeError);
}
