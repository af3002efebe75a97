#include <gtest/gtest.h>

#include "device/local_filesystem.hpp"
#include "testing.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace adbpipe {
namespace {

namespace fs = std::filesystem;

const std::atomic_bool no_cancel{false};

TEST(LocalFileSystemTest, SumsRegularFilesRecursively) {
    testutil::TemporaryDirectory tmp;
    PosixLocalFileSystem lfs;
    const std::string root = tmp.Path();

    ASSERT_TRUE(testutil::WriteTextFile(root + "/a.txt", "hello"));
    fs::create_directories(root + "/nested/deeper");
    ASSERT_TRUE(testutil::WriteTextFile(root + "/nested/b.txt", "abc"));
    ASSERT_TRUE(testutil::WriteTextFile(root + "/nested/deeper/c.bin", std::string(1000, 'z')));

    EXPECT_EQ(lfs.LocalSize(root, no_cancel), 1008u);
    EXPECT_EQ(lfs.LocalSize(root + "/nested", no_cancel), 1003u);
}

TEST(LocalFileSystemTest, SymlinksAreNotCounted) {
    testutil::TemporaryDirectory tmp;
    PosixLocalFileSystem lfs;
    const std::string root = tmp.Path();

    ASSERT_TRUE(testutil::WriteTextFile(root + "/real.txt", "12345"));
    ASSERT_EQ(::symlink((root + "/real.txt").c_str(), (root + "/link.txt").c_str()), 0);
    ASSERT_EQ(::symlink("/usr", (root + "/usr-link").c_str()), 0);

    EXPECT_EQ(lfs.LocalSize(root, no_cancel), 5u);
}

TEST(LocalFileSystemTest, MissingOrEmptyPathIsZero) {
    testutil::TemporaryDirectory tmp;
    PosixLocalFileSystem lfs;

    EXPECT_EQ(lfs.LocalSize("", no_cancel), 0u);
    EXPECT_EQ(lfs.LocalSize(tmp.Path() + "/missing", no_cancel), 0u);
    EXPECT_EQ(lfs.LocalSize(tmp.Path(), no_cancel), 0u);
    EXPECT_FALSE(lfs.Exists(""));
    EXPECT_FALSE(lfs.Exists(tmp.Path() + "/missing"));
    EXPECT_TRUE(lfs.Exists(tmp.Path()));
}

TEST(LocalFileSystemTest, CancelledWalkReportsZero) {
    testutil::TemporaryDirectory tmp;
    PosixLocalFileSystem lfs;
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Path() + "/a.txt", "hello"));

    const std::atomic_bool cancelled{true};
    EXPECT_EQ(lfs.LocalSize(tmp.Path(), cancelled), 0u);
    EXPECT_EQ(lfs.LocalSize(tmp.Path(), no_cancel), 5u);
}

TEST(LocalFileSystemTest, EnsureDirCreatesParents) {
    testutil::TemporaryDirectory tmp;
    PosixLocalFileSystem lfs;
    const std::string dir = tmp.Path() + "/x/y/z";

    ASSERT_TRUE(lfs.EnsureDir(dir).is_ok());
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_TRUE(lfs.EnsureDir(dir).is_ok());

    ASSERT_TRUE(testutil::WriteTextFile(tmp.Path() + "/file", "x"));
    EXPECT_FALSE(lfs.EnsureDir(tmp.Path() + "/file/sub").is_ok());
}

} // namespace
} // namespace adbpipe
