#include <gtest/gtest.h>

#include "device/device_bridge.hpp"
#include "testing.hpp"
#include "util/path_utils.hpp"

#include <cstdint>
#include <string>

namespace adbpipe {
namespace {

TEST(AdbBridgeTest, ParsesDuOutput) {
    std::uint64_t size = 0;
    EXPECT_TRUE(AdbBridge::ParseDuOutput("174598144\t/sdcard/Transfer\n", size));
    EXPECT_EQ(size, 174598144u);
    EXPECT_TRUE(AdbBridge::ParseDuOutput("  42 /x", size));
    EXPECT_EQ(size, 42u);
    EXPECT_TRUE(AdbBridge::ParseDuOutput("7", size));
    EXPECT_EQ(size, 7u);

    size = 99;
    EXPECT_FALSE(AdbBridge::ParseDuOutput("", size));
    EXPECT_FALSE(AdbBridge::ParseDuOutput("du: /sdcard/Transfer: No such file", size));
    EXPECT_FALSE(AdbBridge::ParseDuOutput("12k\t/x", size));
    EXPECT_FALSE(AdbBridge::ParseDuOutput("-5\t/x", size));
    EXPECT_EQ(size, 99u);
}

class AdbBridgeScriptTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string Path(const std::string& name) const { return tmp.Path() + "/" + name; }

    // Records every invocation on its own line, then runs body.
    AdbBridge MakeBridge(const std::string& body) {
        const std::string script = "printf '%s|' \"$@\" >> " + ShellQuote(Path("calls")) + "\n"
                                   "echo >> " + ShellQuote(Path("calls")) + "\n" + body;
        EXPECT_TRUE(testutil::WriteScript(Path("adb"), script));
        return AdbBridge(Path("adb"));
    }

    std::string Calls() const { return testutil::ReadFile(Path("calls")); }
};

TEST_F(AdbBridgeScriptTest, DevicePresentFollowsGetStateExitCode) {
    EXPECT_TRUE(MakeBridge("echo device\n").DevicePresent());
    EXPECT_EQ(Calls(), "get-state|\n");

    EXPECT_FALSE(MakeBridge("echo 'error: no devices/emulators found' >&2\nexit 1\n").DevicePresent());
}

TEST_F(AdbBridgeScriptTest, MissingToolMeansNoDevice) {
    AdbBridge bridge(Path("no-such-adb"));
    EXPECT_FALSE(bridge.DevicePresent());
    EXPECT_EQ(bridge.RemoteSize("/sdcard/Transfer"), 0u);
    EXPECT_FALSE(bridge.EnsureRemoteDir("/sdcard/Transfer").is_ok());
}

TEST_F(AdbBridgeScriptTest, RemoteSizeRunsDuThroughShell) {
    auto bridge = MakeBridge("printf '174598144\\t/sdcard/Transfer\\n'\n");
    EXPECT_EQ(bridge.RemoteSize("/sdcard/Transfer"), 174598144u);
    EXPECT_EQ(Calls(), "shell|du -s -b '/sdcard/Transfer'|\n");
}

TEST_F(AdbBridgeScriptTest, RemoteSizeIsZeroOnFailure) {
    EXPECT_EQ(MakeBridge("echo 'du: No such file' >&2\nexit 1\n").RemoteSize("/sdcard/Transfer"), 0u);
    EXPECT_EQ(MakeBridge("echo garbage\n").RemoteSize("/sdcard/Transfer"), 0u);
}

TEST_F(AdbBridgeScriptTest, EnsureRemoteDirQuotesPath) {
    auto bridge = MakeBridge("exit 0\n");
    ASSERT_TRUE(bridge.EnsureRemoteDir("/sdcard/My Transfer").is_ok());
    EXPECT_EQ(Calls(), "shell|mkdir -p '/sdcard/My Transfer'|\n");

    auto r = MakeBridge("echo 'Read-only file system' >&2\nexit 1\n").EnsureRemoteDir("/system/x");
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, kErrIo);
    EXPECT_NE(r.msg.find("Read-only file system"), std::string::npos);
}

} // namespace
} // namespace adbpipe
