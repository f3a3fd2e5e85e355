// tests/unit/basic/test_temp_dir.cpp - Unit tests for ScopedTempDir

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <utility>

#include "chartscan/basic/temp_dir.hpp"

namespace fs = std::filesystem;
using namespace chartscan;

TEST(BasicTempDir, CreatesAndRemovesDirectory)
{
  fs::path created;
  {
    const ScopedTempDir dir("chartscan_test");
    created = dir.path();
    ASSERT_TRUE(fs::is_directory(created));
    EXPECT_EQ(created.filename().string().rfind("chartscan_test", 0), 0U);

    // Contents are removed too
    fs::create_directories(created / "nested");
    std::ofstream(created / "nested" / "file.txt") << "data";
  }
  EXPECT_FALSE(fs::exists(created));
}

TEST(BasicTempDir, NamesAreUnique)
{
  const ScopedTempDir a("chartscan_test");
  const ScopedTempDir b("chartscan_test");
  EXPECT_NE(a.path(), b.path());
}

TEST(BasicTempDir, MoveTransfersOwnership)
{
  fs::path created;
  {
    ScopedTempDir outer("chartscan_test");
    created = outer.path();
    {
      ScopedTempDir moved(std::move(outer));
      EXPECT_EQ(moved.path(), created);
      EXPECT_TRUE(outer.path().empty());
    }
    // Removed when the new owner went out of scope
    EXPECT_FALSE(fs::exists(created));
  }
  EXPECT_FALSE(fs::exists(created));
}
