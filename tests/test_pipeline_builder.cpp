#include <gtest/gtest.h>

#include "transfer/pipeline_builder.hpp"

#include <string>

namespace adbpipe {
namespace {

TEST(PipelineBuilderTest, PullCommand) {
    PipelineBuilder builder{TransferConfig{}};
    const auto spec = builder.Build(TransferDirection::Pull, "/home/u/out", 1000);

    EXPECT_EQ(spec.command,
              "adb exec-out 'cd /sdcard && tar -c -f - Transfer' | "
              "pv -n -s 1000 | "
              "tar -xf - -C '/home/u/out'");
    ASSERT_EQ(spec.stages.size(), 3u);
    EXPECT_TRUE(spec.stages[0].remote);
    EXPECT_FALSE(spec.stages[1].remote);
    EXPECT_FALSE(spec.stages[2].remote);
    EXPECT_EQ(spec.total_bytes, 1000u);
}

TEST(PipelineBuilderTest, PushCommand) {
    PipelineBuilder builder{TransferConfig{}};
    const auto spec = builder.Build(TransferDirection::Push, "/home/u/in", 42);

    EXPECT_EQ(spec.command,
              "tar -cf - -C '/home/u/in' . | "
              "pv -n -s 42 | "
              "adb shell 'tar -xf - -C /sdcard/Transfer'");
    ASSERT_EQ(spec.stages.size(), 3u);
    EXPECT_FALSE(spec.stages[0].remote);
    EXPECT_TRUE(spec.stages[2].remote);
}

TEST(PipelineBuilderTest, BuildIsDeterministic) {
    PipelineBuilder builder{TransferConfig{}};
    const auto a = builder.Build(TransferDirection::Pull, "/home/u/out", 1000);
    const auto b = builder.Build(TransferDirection::Pull, "/home/u/out", 1000);
    EXPECT_EQ(a.command, b.command);
}

TEST(PipelineBuilderTest, TotalBytesOnlyChangesMeterStage) {
    PipelineBuilder builder{TransferConfig{}};
    const auto a = builder.Build(TransferDirection::Pull, "/home/u/out", 1000);
    const auto b = builder.Build(TransferDirection::Pull, "/home/u/out", 174598144);

    ASSERT_EQ(a.stages.size(), b.stages.size());
    EXPECT_EQ(a.stages[0].command, b.stages[0].command);
    EXPECT_EQ(a.stages[2].command, b.stages[2].command);
    EXPECT_EQ(a.stages[1].name, "meter");
    EXPECT_EQ(b.stages[1].command, "pv -n -s 174598144");
    EXPECT_NE(a.stages[1].command, b.stages[1].command);
}

TEST(PipelineBuilderTest, ZeroSizeStillMeters) {
    PipelineBuilder builder{TransferConfig{}};
    const auto spec = builder.Build(TransferDirection::Push, "/data", 0);
    EXPECT_EQ(spec.stages[1].command, "pv -n -s 0");
}

TEST(PipelineBuilderTest, QuotesLocalPaths) {
    PipelineBuilder builder{TransferConfig{}};
    const auto spec = builder.Build(TransferDirection::Pull, "/home/u/my dir/it's", 1);
    EXPECT_EQ(spec.stages[2].command, "tar -xf - -C '/home/u/my dir/it'\"'\"'s'");
}

TEST(PipelineBuilderTest, UsesConfiguredToolsAndDirectories) {
    TransferConfig cfg;
    cfg.bridge_tool = "/opt/platform tools/adb";
    cfg.metering_tool = "/usr/local/bin/pv";
    cfg.remote_base_dir = "/storage/emulated/0";
    cfg.remote_target_dir = "DCIM";
    cfg.device_staging_dir = "/storage/emulated/0/Inbox";
    PipelineBuilder builder(cfg);

    const auto pull = builder.Build(TransferDirection::Pull, "/tmp/x", 5);
    EXPECT_EQ(pull.stages[0].command,
              "'/opt/platform tools/adb' exec-out 'cd /storage/emulated/0 && tar -c -f - DCIM'");
    EXPECT_EQ(pull.stages[1].command, "/usr/local/bin/pv -n -s 5");

    const auto push = builder.Build(TransferDirection::Push, "/tmp/x", 5);
    EXPECT_EQ(push.stages[2].command,
              "'/opt/platform tools/adb' shell 'tar -xf - -C /storage/emulated/0/Inbox'");

    ASSERT_EQ(push.required_tools.size(), 3u);
    EXPECT_EQ(push.required_tools[0], "/opt/platform tools/adb");
    EXPECT_EQ(push.required_tools[1], "/usr/local/bin/pv");
    EXPECT_EQ(push.required_tools[2], "tar");
}

TEST(PipelineBuilderTest, ParsesDirection) {
    TransferDirection d{};
    ASSERT_TRUE(ParseDirection("pull", d));
    EXPECT_EQ(d, TransferDirection::Pull);
    ASSERT_TRUE(ParseDirection("push", d));
    EXPECT_EQ(d, TransferDirection::Push);
    EXPECT_FALSE(ParseDirection("Pull", d));
    EXPECT_FALSE(ParseDirection("", d));
    EXPECT_STREQ(ToString(TransferDirection::Pull), "pull");
}

} // namespace
} // namespace adbpipe
