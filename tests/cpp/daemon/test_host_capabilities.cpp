#include "daemon/host_capabilities.h"

#include <gtest/gtest.h>

using namespace diarizer::daemon_core;

TEST(HostCapabilities, WorkerCheckExitStatusDecidesBackend) {
    EXPECT_TRUE(queryWorkerBackend({"true"}));
    EXPECT_FALSE(queryWorkerBackend({"false"}));
}

TEST(HostCapabilities, MissingWorkerMeansNoBackend) {
    EXPECT_FALSE(queryWorkerBackend({}));
    EXPECT_FALSE(queryWorkerBackend({"/nonexistent/diarizer_worker"}));
}

TEST(HostCapabilities, ProbeIsConsistent) {
    auto caps = probeHostCapabilities({"true"});
    EXPECT_GE(caps.cpuCount, 1u);
    EXPECT_TRUE(caps.backendAvailable);
    EXPECT_GE(caps.acceleratorCount, 0);
    if (!caps.acceleratorAvailable) {
        EXPECT_EQ(caps.acceleratorCount, 0);
    }
}
