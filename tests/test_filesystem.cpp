/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * tftpsrv is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * tftpsrv is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with tftpsrv.  If not, see <https://www.gnu.org/licenses/>.
 */

// NOLINTBEGIN
#include "tftpsrv/filesystem.hpp"

#include <array>
#include <filesystem>
#include <format>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <system_error>

using namespace tftpsrv::filesystem;

class TestFileSystem : public ::testing::Test {
protected:
  auto SetUp() -> void override
  {
    target = (std::filesystem::temp_directory_path() / "tftpsrv_fs.")
                 .concat(std::format("{:05d}", count().load()));
    std::filesystem::remove(target);
  }

  auto TearDown() -> void override
  {
    std::filesystem::remove(target);
    if (!tmp.empty())
      std::filesystem::remove(tmp);
  }

  std::filesystem::path target;
  std::filesystem::path tmp;
};

TEST_F(TestFileSystem, CountReturnsSameReference)
{
  auto &count1 = count();
  auto &count2 = count();

  EXPECT_EQ(&count1, &count2);
}

TEST_F(TestFileSystem, TmpnameIsBesideTarget)
{
  const auto path = tmpname(target);
  const auto filename = path.filename().string();

  EXPECT_TRUE(filename.starts_with(std::string(prefix) +
                                   target.filename().string()));
  EXPECT_EQ(path.parent_path(), target.parent_path());
}

TEST_F(TestFileSystem, TmpnameIncrementsCounter)
{
  const auto initial_count = count().load();
  const auto path1 = tmpname(target);
  const auto path2 = tmpname(target);
  const auto path3 = tmpname(target);

  EXPECT_NE(path1, path2);
  EXPECT_NE(path2, path3);
  EXPECT_NE(path1, path3);
  EXPECT_EQ(count().load(), static_cast<std::uint16_t>(initial_count + 3));
}

TEST_F(TestFileSystem, TouchCreatesNewFile)
{
  EXPECT_FALSE(std::filesystem::exists(target));

  const auto err = touch(target);

  EXPECT_FALSE(err);
  EXPECT_TRUE(std::filesystem::exists(target));
}

TEST_F(TestFileSystem, TouchPreservesExistingFile)
{
  std::ofstream(target) << "existing content";

  const auto err = touch(target);

  EXPECT_FALSE(err);
  EXPECT_EQ(std::filesystem::file_size(target), 16);
}

TEST_F(TestFileSystem, OpenReadOpensFileForReading)
{
  std::ofstream(target) << "some data";

  std::error_code err;
  auto fstream = open_read(target, err);

  ASSERT_TRUE(fstream);
  EXPECT_TRUE(fstream->is_open());
  EXPECT_FALSE(err);
}

TEST_F(TestFileSystem, OpenReadMissingFile)
{
  std::error_code err;
  auto fstream = open_read(target, err);

  EXPECT_FALSE(fstream);
  EXPECT_EQ(err, std::errc::no_such_file_or_directory);
}

TEST_F(TestFileSystem, OpenReadDirectory)
{
  std::error_code err;
  auto fstream = open_read(std::filesystem::temp_directory_path(), err);

  EXPECT_FALSE(fstream);
  EXPECT_EQ(err, std::errc::permission_denied);
}

TEST_F(TestFileSystem, OpenReadUnreadableFile)
{
  std::ofstream(target) << "secret";
  std::filesystem::permissions(target, std::filesystem::perms::none);

  std::error_code err;
  auto fstream = open_read(target, err);

  // Privileged users can read anything.
  if (fstream)
    GTEST_SKIP() << "Running with elevated privileges.";

  EXPECT_EQ(err, std::errc::permission_denied);
}

TEST_F(TestFileSystem, OpenWriteOpensTempFileForWriting)
{
  std::error_code err;
  auto fstream = open_write(target, tmp, err);

  ASSERT_TRUE(fstream);
  EXPECT_TRUE(fstream->is_open());
  EXPECT_FALSE(err);
  EXPECT_TRUE(std::filesystem::exists(tmp));
  EXPECT_TRUE(std::filesystem::exists(target));
}

TEST_F(TestFileSystem, OpenWriteMissingDirectory)
{
  std::error_code err;
  auto fstream = open_write(target / "file", tmp, err);

  EXPECT_FALSE(fstream);
  EXPECT_EQ(err, std::errc::no_such_file_or_directory);
  EXPECT_TRUE(tmp.empty());
}

TEST_F(TestFileSystem, ReadChunkReadsInBlocks)
{
  {
    auto outf = std::ofstream(target, std::ios::binary);
    outf << std::string(700, 'x');
  }

  std::error_code err;
  auto fstream = open_read(target, err);
  ASSERT_TRUE(fstream);

  auto buf = std::array<char, 512>{};
  EXPECT_EQ(read_chunk(*fstream, buf, err), 512);
  EXPECT_FALSE(err);
  EXPECT_EQ(read_chunk(*fstream, buf, err), 188);
  EXPECT_FALSE(err);
  EXPECT_EQ(read_chunk(*fstream, buf, err), 0);
  EXPECT_FALSE(err);
}

TEST_F(TestFileSystem, CommitReplacesTarget)
{
  std::ofstream(target) << "old contents";

  std::error_code err;
  auto fstream = open_write(target, tmp, err);
  ASSERT_TRUE(fstream);

  auto payload = std::string_view("new contents");
  EXPECT_FALSE(write_chunk(*fstream, payload));

  // Nothing is visible at the target before the commit.
  EXPECT_EQ(std::filesystem::file_size(target), 12);
  EXPECT_EQ(std::filesystem::file_size(tmp), payload.size());

  EXPECT_FALSE(commit(*fstream, tmp, target));
  EXPECT_FALSE(std::filesystem::exists(tmp));

  auto inf = std::ifstream(target);
  auto contents = std::string();
  std::getline(inf, contents);
  EXPECT_EQ(contents, payload);
}
// NOLINTEND
