/***
 * Name: test_support_fs
 * Purpose: File helpers, PATH lookup and module naming.
 */
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>

#include "pyscope/support/error.h"
#include "pyscope/support/fs.h"

namespace fs = std::filesystem;
using namespace pyscope;

static fs::path scratchDir() {
  const fs::path dir = fs::temp_directory_path() / ("pyscope_support_" + std::to_string(::getpid()));
  std::error_code ec;
  fs::create_directories(dir, ec);
  return dir;
}

TEST(SupportFs, WriteThenReadFile) {
  const auto path = (scratchDir() / "data.txt").string();
  std::string err;
  ASSERT_TRUE(support::WriteFile(path, "line1\nline2\n", err)) << err;
  std::string back;
  ASSERT_TRUE(support::ReadFile(path, back, err)) << err;
  EXPECT_EQ(back, "line1\nline2\n");
  EXPECT_TRUE(support::FileExists(path));
  EXPECT_TRUE(support::RemoveFile(path));
  EXPECT_FALSE(support::FileExists(path));
  // removing an absent file is not an error
  EXPECT_TRUE(support::RemoveFile(path));
}

TEST(SupportFs, ReadDirectoryFails) {
  std::string out;
  std::string err;
  EXPECT_FALSE(support::ReadFile(scratchDir().string(), out, err));
  EXPECT_EQ(err, "Is a directory");
}

TEST(SupportFs, ReadMissingFileFails) {
  std::string out;
  std::string err;
  EXPECT_FALSE(support::ReadFile((scratchDir() / "nope.py").string(), out, err));
  EXPECT_FALSE(err.empty());
}

TEST(SupportFs, ModuleNameFromPath) {
  EXPECT_EQ(support::ModuleNameFromPath("pkg/sub/tool.py"), "tool");
  EXPECT_EQ(support::ModuleNameFromPath("tool.py"), "tool");
  EXPECT_EQ(support::ModuleNameFromPath("/abs/archive.tar.py"), "archive.tar");
  EXPECT_EQ(support::ModuleNameFromPath("script"), "script");
  EXPECT_EQ(support::ModuleNameFromPath("stub.pyi"), "stub");
  EXPECT_EQ(support::ModuleNameFromPath("gui/mod.pyw"), "mod");
  EXPECT_EQ(support::ModuleNameFromPath("notes/script.txt"), "script");
}

TEST(SupportFs, FindExecutableOnPath) {
  std::string found;
  ASSERT_TRUE(support::FindExecutable("sh", found));
  EXPECT_NE(found.find("/sh"), std::string::npos);
  EXPECT_FALSE(support::FindExecutable("definitely-not-a-real-binary-xyz", found));
  EXPECT_FALSE(support::FindExecutable("/nonexistent/dir/dot", found));
  EXPECT_FALSE(support::FindExecutable("", found));
}
