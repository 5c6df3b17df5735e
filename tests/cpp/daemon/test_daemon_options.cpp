#include "daemon/daemon_options.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using diarizer::daemon_core::parseDaemonOptions;
using diarizer::daemon_core::ParseDaemonOptionsResult;

namespace {

ParseDaemonOptionsResult parse(std::vector<std::string> args) {
    args.insert(args.begin(), "diarizerd");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return parseDaemonOptions(static_cast<int>(args.size()), argv.data());
}

}  // namespace

TEST(DaemonOptions, NoArgumentsUsesConfigValues) {
    auto result = parse({});
    ASSERT_FALSE(result.hasError);
    ASSERT_TRUE(result.options.has_value());
    EXPECT_TRUE(result.options->configPath.empty());
    EXPECT_TRUE(result.options->endpoint.empty());
    EXPECT_TRUE(result.options->pidFile.empty());
}

TEST(DaemonOptions, ParsesAllOptions) {
    auto result = parse({"-c", "/etc/diarizer.json", "--endpoint", "tcp://0.0.0.0:5600",
                         "--pid-file", "/run/diarizerd.pid"});
    ASSERT_FALSE(result.hasError) << result.errorMessage;
    ASSERT_TRUE(result.options.has_value());
    EXPECT_EQ(result.options->configPath, "/etc/diarizer.json");
    EXPECT_EQ(result.options->endpoint, "tcp://0.0.0.0:5600");
    EXPECT_EQ(result.options->pidFile, "/run/diarizerd.pid");
}

TEST(DaemonOptions, HelpAndVersion) {
    EXPECT_TRUE(parse({"--help"}).showHelp);
    EXPECT_TRUE(parse({"-V"}).showVersion);
    EXPECT_FALSE(parse({"-V"}).options.has_value());
}

TEST(DaemonOptions, RejectsEndpointWithoutScheme) {
    auto result = parse({"-e", "localhost:5600"});
    EXPECT_TRUE(result.hasError);
    EXPECT_FALSE(result.options.has_value());
}

TEST(DaemonOptions, RejectsUnknownAndIncompleteOptions) {
    EXPECT_TRUE(parse({"--verbose"}).hasError);
    auto incomplete = parse({"--config"});
    EXPECT_TRUE(incomplete.hasError);
    EXPECT_NE(incomplete.errorMessage.find("--config"), std::string::npos);
}
