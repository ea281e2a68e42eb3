#include "sandbox/workspace.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace funcjudge;
using namespace funcjudge::sandbox;

TEST(WorkspaceTest, CreatedAndRemoved) {
    auto options = test::setup_test_environment("WorkspaceTest");
    filesystem::path dir;
    {
        workspace ws(options.run_dir);
        dir = ws.path();
        EXPECT_TRUE(filesystem::is_directory(dir));
        EXPECT_EQ(dir.parent_path(), options.run_dir);

        auto file = ws.write_file("Solution.java", "class Solution {}");
        EXPECT_EQ(file, dir / "Solution.java");
        EXPECT_EQ(read_file_content(file), "class Solution {}");
    }
    EXPECT_FALSE(filesystem::exists(dir));
}

TEST(WorkspaceTest, UniqueNames) {
    auto options = test::setup_test_environment("WorkspaceTest");
    workspace a(options.run_dir), b(options.run_dir);
    EXPECT_NE(a.path(), b.path());
}

TEST(WorkspaceTest, RemovedWhenExceptionThrown) {
    auto options = test::setup_test_environment("WorkspaceTest");
    filesystem::path dir;
    try {
        workspace ws(options.run_dir);
        dir = ws.path();
        ws.write_file("input.json", "{}");
        throw internal_error("grading failed");
    } catch (internal_error &) {
    }
    EXPECT_FALSE(dir.empty());
    EXPECT_FALSE(filesystem::exists(dir));
}

TEST(WorkspaceTest, RejectsUnsafeFileNames) {
    auto options = test::setup_test_environment("WorkspaceTest");
    workspace ws(options.run_dir);
    EXPECT_THROW(ws.write_file("../escape.txt", ""), internal_error);
    EXPECT_THROW(ws.write_file("/etc/passwd", ""), internal_error);
    EXPECT_THROW(ws.write_file("", ""), internal_error);
    EXPECT_FALSE(filesystem::exists(options.run_dir / "escape.txt"));
}
