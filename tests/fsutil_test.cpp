#include <gtest/gtest.h>
#include <fstream>
#include <unistd.h>

#include "errors.hpp"
#include "fsutil.hpp"

using namespace labelsheet;

TEST(FsUtilTest, EnsureDirCreatesNestedFolders) {
    std::string root = join2(::testing::TempDir(), "labelsheet_mkdir_" + std::to_string(::getpid()));
    std::string deep = join2(root, "a/b/c");
    ensure_dir(deep);
    EXPECT_TRUE(is_dir(deep));
    ensure_dir(deep);   // existing folder is fine
    EXPECT_TRUE(is_dir(deep));
}

TEST(FsUtilTest, EnsureDirNamesBlockingComponent) {
    std::string root = join2(::testing::TempDir(), "labelsheet_block_" + std::to_string(::getpid()));
    ensure_dir(root);
    std::string blocker = join2(root, "plainfile");
    { std::ofstream f(blocker); f << "x"; }
    try {
        ensure_dir(join2(blocker, "sub/dir"));
        FAIL() << "expected OutputWriteError";
    } catch (const OutputWriteError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("(" + blocker + ": "), std::string::npos) << msg;
        EXPECT_NE(msg.find("Not a directory"), std::string::npos) << msg;
    }
}

TEST(FsUtilTest, PathHelpers) {
    EXPECT_EQ(path_basename("in/batch.csv"), "batch.csv");
    EXPECT_EQ(path_stem("in/batch.v2.csv"), "batch.v2");
    EXPECT_EQ(path_dirname("out/x.pdf"), "out");
    EXPECT_EQ(path_dirname("x.pdf"), "");
    EXPECT_EQ(path_dirname("/x.pdf"), "/");
    EXPECT_EQ(join2("out/", "x.pdf"), "out/x.pdf");
    EXPECT_EQ(join2(".", "x.pdf"), "x.pdf");
}
