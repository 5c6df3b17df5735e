/**
 * @file test_device_selector.cpp
 * @brief Device selection with a scripted accelerator probe
 */

#include "helpers/worker_fakes.h"
#include "worker/device_selector.h"

#include <gtest/gtest.h>

using namespace diarizer;

TEST(DeviceSelector, AcceleratorWhenPreferredAndHealthy) {
    auto probe = std::make_shared<test::FakeProbe>();
    worker::DeviceSelector selector(probe);
    EXPECT_EQ(selector.select(true), Device::cuda(0));
    EXPECT_EQ(probe->selfTests, 1);
}

TEST(DeviceSelector, CpuWhenNotPreferred) {
    auto probe = std::make_shared<test::FakeProbe>();
    worker::DeviceSelector selector(probe);
    EXPECT_EQ(selector.select(false), Device::cpu());
    EXPECT_EQ(probe->selfTests, 0);
}

TEST(DeviceSelector, CpuWhenUnavailable) {
    auto probe = std::make_shared<test::FakeProbe>();
    probe->isAvailable = false;
    worker::DeviceSelector selector(probe);
    EXPECT_EQ(selector.select(true), Device::cpu());
    EXPECT_EQ(probe->selfTests, 0);
}

TEST(DeviceSelector, FailedSelfTestFallsBackWithoutRetry) {
    auto probe = std::make_shared<test::FakeProbe>();
    probe->failSelfTest = true;
    worker::DeviceSelector selector(probe);
    EXPECT_EQ(selector.select(true), Device::cpu());
    EXPECT_EQ(probe->selfTests, 1);
}

TEST(DeviceSelector, NullProbeMeansCpu) {
    worker::DeviceSelector selector(nullptr);
    EXPECT_EQ(selector.select(true), Device::cpu());
}

TEST(DeviceSelector, DefaultProbeNeverFails) {
    auto probe = worker::createAcceleratorProbe();
    ASSERT_NE(probe, nullptr);
    worker::DeviceSelector selector(std::shared_ptr<worker::AcceleratorProbe>(std::move(probe)));
    const Device device = selector.select(true);
    EXPECT_TRUE(device == Device::cpu() || device.isAccelerator());
}

TEST(Device, Names) {
    EXPECT_EQ(Device::cpu().name(), "cpu");
    EXPECT_EQ(Device::cuda(1).name(), "cuda:1");
    EXPECT_NE(Device::cuda(0), Device::cuda(1));
}
