/**
 * @file test_child_process.cpp
 * @brief Unit tests for the spawned-child RAII handle
 */

#include "helpers/temp_dir.h"
#include "process/child_process.h"

#include <chrono>
#include <csignal>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <type_traits>

using namespace diarizer;
using namespace std::chrono_literals;

namespace {

// Dead or zombie (exited, waiting for its new parent to reap it)
bool processGone(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open()) {
        return true;
    }
    std::string line;
    std::getline(stat, line);
    const auto close = line.rfind(')');
    return close != std::string::npos && close + 2 < line.size() && line[close + 2] == 'Z';
}

}  // namespace

TEST(ChildProcess, ReportsExitCode) {
    auto child = process::ChildProcess::spawn({"/bin/sh", "-c", "exit 3"});
    auto status = child->waitFor(5s);
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->exited);
    EXPECT_EQ(status->code, 3);
    EXPECT_FALSE(child->running());
    EXPECT_EQ(status->describe(), "exit code 3");
}

TEST(ChildProcess, ReportsTerminatingSignal) {
    auto child = process::ChildProcess::spawn({"/bin/sh", "-c", "kill -9 $$"});
    auto status = child->waitFor(5s);
    ASSERT_TRUE(status.has_value());
    EXPECT_FALSE(status->exited);
    EXPECT_TRUE(status->signaled);
    EXPECT_EQ(status->signal, SIGKILL);
}

TEST(ChildProcess, WaitForTimesOutOnRunningChild) {
    auto child = process::ChildProcess::spawn({"sleep", "30"});
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(child->waitFor(200ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 190ms);
    EXPECT_TRUE(child->running());

    EXPECT_TRUE(child->sendSignal(SIGTERM));
    auto status = child->waitFor(5s);
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->signaled);
    EXPECT_EQ(status->signal, SIGTERM);
    EXPECT_FALSE(child->sendSignal(SIGTERM));
}

TEST(ChildProcess, WaitForAcceptsDeadlineBeyondPollRange) {
    auto child = process::ChildProcess::spawn({"sleep", "0.2"});
    const auto start = std::chrono::steady_clock::now();
    auto status = child->waitFor(std::chrono::hours(24 * 40));
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->exited);
    EXPECT_EQ(status->code, 0);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(ChildProcess, OnlySpawnCreatesHandles) {
    static_assert(!std::is_constructible<process::ChildProcess, pid_t, int, bool>::value,
                  "handles come from spawn()");
    static_assert(!std::is_default_constructible<process::ChildProcess>::value,
                  "handles come from spawn()");
    static_assert(!std::is_copy_constructible<process::ChildProcess>::value,
                  "one handle per child");

    auto child = process::ChildProcess::spawn({"true"});
    ASSERT_NE(child, nullptr);
    EXPECT_GT(child->pid(), 0);
    EXPECT_TRUE(child->wait().exited);
}

TEST(ChildProcess, SignalDispositionsAreReset) {
    // An ignored SIGTERM in the parent must not leak into the child
    auto previous = std::signal(SIGTERM, SIG_IGN);
    auto child = process::ChildProcess::spawn({"sleep", "30"});
    std::signal(SIGTERM, previous);

    child->sendSignal(SIGTERM);
    auto status = child->waitFor(5s);
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->signaled);
}

TEST(ChildProcess, SpawnFailures) {
    EXPECT_THROW(process::ChildProcess::spawn({}), std::invalid_argument);
    EXPECT_THROW(process::ChildProcess::spawn({"/nonexistent/diarizer_worker"}),
                 std::system_error);
}

TEST(ChildProcess, DestructorKillsRunningChild) {
    pid_t pid = 0;
    {
        auto child = process::ChildProcess::spawn({"sleep", "30"});
        pid = child->pid();
        EXPECT_TRUE(child->running());
    }
    EXPECT_TRUE(processGone(pid));
}

TEST(ChildProcess, GroupSignalReachesDescendants) {
    test::TempDir dir;
    const std::string pidFile = dir.file("grandchild.pid");
    auto child = process::ChildProcess::spawn(
        {"/bin/sh", "-c", "sleep 30 & echo $! > " + pidFile + "; wait"});

    pid_t grandchild = 0;
    for (int i = 0; i < 100 && grandchild == 0; ++i) {
        std::ifstream in(pidFile);
        in >> grandchild;
        if (grandchild == 0) {
            std::this_thread::sleep_for(20ms);
        }
    }
    ASSERT_GT(grandchild, 0);

    child->sendSignal(SIGKILL);
    ASSERT_TRUE(child->waitFor(5s).has_value());

    bool gone = false;
    for (int i = 0; i < 100 && !gone; ++i) {
        gone = processGone(grandchild);
        if (!gone) {
            std::this_thread::sleep_for(20ms);
        }
    }
    EXPECT_TRUE(gone);
}

TEST(ChildProcess, RunToCompletion) {
    auto ok = process::runToCompletion({"/bin/sh", "-c", "exit 0"});
    EXPECT_TRUE(ok.exited);
    EXPECT_EQ(ok.code, 0);

    auto failed = process::runToCompletion({"/bin/sh", "-c", "exit 1"});
    EXPECT_EQ(failed.code, 1);
}
