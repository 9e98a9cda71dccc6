/**
 * @file test_tool_locator.cpp
 * @brief Unit tests for transfer tool discovery
 */

#include <gtest/gtest.h>

#include <cloudxfer/process/tool_locator.h>

#include "test_fixtures.h"

namespace cloudxfer::test {

using process::discover_tool_path;

class ToolLocatorTest : public TempDirectoryFixture {
protected:
    const std::string tool_name_ = "cloudxfer-test-tool-" + std::to_string(std::random_device{}());
};

TEST_F(ToolLocatorTest, BareNameWhenNothingFound) {
    EXPECT_EQ(discover_tool_path(tool_name_, test_dir_), tool_name_);
}

TEST_F(ToolLocatorTest, FindsBinSubdirectory) {
    std::filesystem::create_directories(test_dir_ / "bin");
    create_tool_script("bin/" + tool_name_, "exit 0");

    EXPECT_EQ(discover_tool_path(tool_name_, test_dir_), (test_dir_ / "bin" / tool_name_).string());
}

TEST_F(ToolLocatorTest, SameDirectoryWinsOverBin) {
    std::filesystem::create_directories(test_dir_ / "bin");
    create_tool_script("bin/" + tool_name_, "exit 0");
    create_tool_script(tool_name_, "exit 0");

    EXPECT_EQ(discover_tool_path(tool_name_, test_dir_), (test_dir_ / tool_name_).string());
}

TEST_F(ToolLocatorTest, DefaultName) {
    EXPECT_STREQ(process::default_tool_name, "ossutil");
}

TEST(ExecutableDirectoryTest, ResolvesOnLinux) {
    auto dir = process::executable_directory();
    ASSERT_TRUE(dir.has_value());
    EXPECT_TRUE(std::filesystem::is_directory(*dir));
}

}  // namespace cloudxfer::test
