/**
 * @file test_worker_entry.cpp
 * @brief Worker state machine with fake probe, pipeline and transcoder
 */

#include "helpers/temp_dir.h"
#include "helpers/worker_fakes.h"
#include "job/result_channel.h"
#include "worker/worker_entry.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace diarizer;
using worker::WorkerState;

class WorkerEntryTest : public ::testing::Test {
   protected:
    test::TempDir dir;
    std::shared_ptr<test::FakeProbe> probe = std::make_shared<test::FakeProbe>();
    std::shared_ptr<test::FakeTranscoder> transcoder = std::make_shared<test::FakeTranscoder>();
    std::shared_ptr<test::CountingCache> cache = std::make_shared<test::CountingCache>();
    test::FakePipeline* pipeline = nullptr;  // owned by the worker once created

    worker::WorkerDependencies deps(test::FakePipeline::RunFn fn) {
        worker::WorkerDependencies d;
        d.probe = probe;
        d.transcoder = transcoder;
        d.cache = cache;
        d.pipelineFactory = [this, fn]() {
            auto created = std::make_unique<test::FakePipeline>(fn);
            pipeline = created.get();
            return std::unique_ptr<pipeline::DiarizationPipeline>(std::move(created));
        };
        return d;
    }

    worker::WorkerArgs args(bool accelerated = true) const {
        worker::WorkerArgs a;
        a.inputPath = dir.file("meeting.mp3");
        a.outputPath = dir.file("result.json");
        a.preferAccelerated = accelerated;
        return a;
    }

    static pipeline::Annotation twoSpeakers() {
        return {{1.2, 3.0, "SPEAKER_01"}, {0.0, 1.2, "SPEAKER_00"}, {3.0, 4.5, "SPEAKER_00"}};
    }
};

TEST_F(WorkerEntryTest, HappyPathOnAccelerator) {
    worker::WorkerEntry entry(deps([](const Device&, const std::string&) { return twoSpeakers(); }));
    auto a = args();
    a.batchSize = 8;

    auto result = entry.execute(a);
    ASSERT_TRUE(std::holds_alternative<job::Success>(result));
    const auto& success = std::get<job::Success>(result);
    EXPECT_EQ(success.deviceUsed, "cuda:0");
    EXPECT_FALSE(success.fallbackUsed);
    EXPECT_EQ(success.speakers, (std::vector<std::string>{"SPEAKER_00", "SPEAKER_01"}));
    ASSERT_EQ(success.segments.size(), 3u);
    EXPECT_DOUBLE_EQ(success.segments[0].start, 0.0);
    EXPECT_DOUBLE_EQ(success.segments[2].start, 3.0);
    EXPECT_GE(success.processingTime, 0.0);

    EXPECT_EQ(entry.history(),
              (std::vector<WorkerState>{WorkerState::Init, WorkerState::DeviceBound,
                                        WorkerState::Converting, WorkerState::Inferring,
                                        WorkerState::Extracting, WorkerState::Done}));
    ASSERT_NE(pipeline, nullptr);
    EXPECT_EQ(pipeline->batchSizes, std::vector<int>{8});
    EXPECT_EQ(pipeline->inputs,
              std::vector<std::string>{worker::WorkerEntry::convertedPathFor(a.outputPath)});
    EXPECT_FALSE(std::filesystem::exists(worker::WorkerEntry::convertedPathFor(a.outputPath)));
}

TEST_F(WorkerEntryTest, CpuRequestSkipsBatchSize) {
    worker::WorkerEntry entry(deps([](const Device&, const std::string&) { return twoSpeakers(); }));
    auto result = entry.execute(args(false));
    ASSERT_TRUE(std::holds_alternative<job::Success>(result));
    EXPECT_EQ(std::get<job::Success>(result).deviceUsed, "cpu");
    EXPECT_TRUE(pipeline->batchSizes.empty());
    EXPECT_EQ(probe->selfTests, 0);
}

TEST_F(WorkerEntryTest, MemoryFailureFallsBackToCpuOnce) {
    worker::WorkerEntry entry(deps([](const Device& device, const std::string&) {
        if (device.isAccelerator()) {
            throw std::runtime_error("CUDA out of memory. Tried to allocate 1.5 GiB");
        }
        return twoSpeakers();
    }));

    auto a = args();
    auto result = entry.execute(a);
    ASSERT_TRUE(std::holds_alternative<job::Success>(result));
    const auto& success = std::get<job::Success>(result);
    EXPECT_EQ(success.deviceUsed, "cpu");
    EXPECT_TRUE(success.fallbackUsed);

    EXPECT_EQ(entry.history(),
              (std::vector<WorkerState>{WorkerState::Init, WorkerState::DeviceBound,
                                        WorkerState::Converting, WorkerState::Inferring,
                                        WorkerState::MemoryFailure, WorkerState::RetryingCpu,
                                        WorkerState::Extracting, WorkerState::Done}));
    EXPECT_EQ(pipeline->devices, (std::vector<Device>{Device::cuda(0), Device::cpu()}));
    EXPECT_EQ(pipeline->inputs.size(), 2u);
    EXPECT_FALSE(std::filesystem::exists(worker::WorkerEntry::convertedPathFor(a.outputPath)));
}

TEST_F(WorkerEntryTest, FailedCpuRetryIsFailure) {
    worker::WorkerEntry entry(deps([](const Device&, const std::string&) -> pipeline::Annotation {
        throw std::runtime_error("out of memory");
    }));
    auto a = args();
    auto result = entry.execute(a);
    ASSERT_TRUE(std::holds_alternative<job::Failure>(result));
    EXPECT_EQ(std::get<job::Failure>(result).reason.rfind("cpu fallback failed", 0), 0u);
    EXPECT_EQ(entry.state(), WorkerState::Failed);
    EXPECT_EQ(pipeline->inputs.size(), 2u);
    EXPECT_FALSE(std::filesystem::exists(worker::WorkerEntry::convertedPathFor(a.outputPath)));
}

TEST_F(WorkerEntryTest, FatalInferenceErrorDoesNotRetry) {
    worker::WorkerEntry entry(deps([](const Device&, const std::string&) -> pipeline::Annotation {
        throw std::runtime_error("model file is corrupt");
    }));
    auto result = entry.execute(args());
    ASSERT_TRUE(std::holds_alternative<job::Failure>(result));
    EXPECT_EQ(std::get<job::Failure>(result).reason, "model file is corrupt");
    EXPECT_EQ(pipeline->inputs.size(), 1u);
    EXPECT_EQ(entry.history().back(), WorkerState::Failed);
}

TEST_F(WorkerEntryTest, MemoryFailureOnCpuRetriesOnCpu) {
    int calls = 0;
    worker::WorkerEntry entry(
        deps([&calls](const Device&, const std::string&) -> pipeline::Annotation {
            if (++calls == 1) {
                throw std::bad_alloc();
            }
            return twoSpeakers();
        }));
    auto result = entry.execute(args(false));
    ASSERT_TRUE(std::holds_alternative<job::Success>(result));
    EXPECT_TRUE(std::get<job::Success>(result).fallbackUsed);
    EXPECT_EQ(std::get<job::Success>(result).deviceUsed, "cpu");
}

TEST_F(WorkerEntryTest, TranscodeFailureIsFailure) {
    transcoder->fail = true;
    worker::WorkerEntry entry(deps([](const Device&, const std::string&) { return twoSpeakers(); }));
    auto result = entry.execute(args());
    ASSERT_TRUE(std::holds_alternative<job::Failure>(result));
    EXPECT_NE(std::get<job::Failure>(result).reason.find("ffmpeg failed"), std::string::npos);
    EXPECT_TRUE(pipeline->inputs.empty());
    EXPECT_EQ(entry.history().back(), WorkerState::Failed);
}

TEST_F(WorkerEntryTest, MissingPipelineFactoryIsFailure) {
    auto d = deps([](const Device&, const std::string&) { return twoSpeakers(); });
    d.pipelineFactory = nullptr;
    worker::WorkerEntry entry(std::move(d));
    auto result = entry.execute(args());
    EXPECT_TRUE(std::holds_alternative<job::Failure>(result));
}

TEST_F(WorkerEntryTest, EmptyAnnotationIsSuccess) {
    worker::WorkerEntry entry(
        deps([](const Device&, const std::string&) { return pipeline::Annotation{}; }));
    auto result = entry.execute(args());
    ASSERT_TRUE(std::holds_alternative<job::Success>(result));
    EXPECT_TRUE(std::get<job::Success>(result).segments.empty());
    EXPECT_TRUE(std::get<job::Success>(result).speakers.empty());
}

// ============================================================
// run(): artifact publication and exit codes
// ============================================================

TEST_F(WorkerEntryTest, RunWritesSuccessArtifact) {
    worker::WorkerEntry entry(deps([](const Device&, const std::string&) { return twoSpeakers(); }));
    auto a = args();
    EXPECT_EQ(entry.run(a), worker::EXIT_JOB_SUCCEEDED);

    std::ifstream in(a.outputPath);
    auto outcome = job::parseArtifact(nlohmann::json::parse(in));
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(std::holds_alternative<job::Success>(*outcome));
    EXPECT_EQ(std::get<job::Success>(*outcome).segments.size(), 3u);
    EXPECT_FALSE(std::filesystem::exists(a.outputPath + ".tmp"));
}

TEST_F(WorkerEntryTest, RunWritesFailureArtifact) {
    transcoder->fail = true;
    worker::WorkerEntry entry(deps([](const Device&, const std::string&) { return twoSpeakers(); }));
    auto a = args();
    EXPECT_EQ(entry.run(a), worker::EXIT_JOB_FAILED);

    std::ifstream in(a.outputPath);
    auto doc = nlohmann::json::parse(in);
    EXPECT_FALSE(doc["success"].get<bool>());
    EXPECT_TRUE(doc["error"].is_string());
}

TEST_F(WorkerEntryTest, RunReportsUnwritableArtifact) {
    worker::WorkerEntry entry(deps([](const Device&, const std::string&) { return twoSpeakers(); }));
    auto a = args();
    a.outputPath = "/nonexistent/dir/result.json";
    EXPECT_EQ(entry.run(a), worker::EXIT_ARTIFACT_WRITE_FAILED);
}

TEST(WorkerState, Names) {
    EXPECT_STREQ(worker::workerStateName(WorkerState::RetryingCpu), "RetryingCpu");
    EXPECT_STREQ(worker::workerStateName(WorkerState::Done), "Done");
}
