// Copyright 2026 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "utils/file.hpp"

namespace fs = std::filesystem;

namespace {

std::string ReadAll(const fs::path &path) {
  std::ifstream stream(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
}

void CreateFile(const fs::path &path, const std::string &content) {
  std::ofstream stream(path, std::ios::binary);
  stream << content;
}

}  // namespace

class UtilsFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Clear();
    fs::create_directories(storage);
  }

  void TearDown() override { Clear(); }

  fs::path storage{fs::temp_directory_path() /
                   (std::string("sifparts_test_unit_utils_file_") + ::testing::UnitTest::GetInstance()->current_test_info()->name())};

 private:
  void Clear() {
    if (fs::exists(storage)) fs::remove_all(storage);
  }
};

TEST_F(UtilsFileTest, EnsureDirAndDeleteDir) {
  auto const path = storage / "a" / "b";
  ASSERT_TRUE(sifparts::utils::EnsureDir(path));
  ASSERT_TRUE(sifparts::utils::DirExists(path));
  // Existing directories are left as they are.
  ASSERT_TRUE(sifparts::utils::EnsureDir(path));
  ASSERT_TRUE(sifparts::utils::DeleteDir(storage / "a"));
  ASSERT_FALSE(fs::exists(storage / "a"));
  ASSERT_FALSE(sifparts::utils::DeleteDir(storage / "a"));
}

TEST_F(UtilsFileTest, EnsureDirOverFile) {
  CreateFile(storage / "file", "x");
  ASSERT_FALSE(sifparts::utils::EnsureDir(storage / "file"));
  ASSERT_FALSE(sifparts::utils::DeleteDir(storage / "file"));
  ASSERT_THROW(sifparts::utils::EnsureDirOrThrow(storage / "file"), sifparts::utils::FileException);
  ASSERT_THROW(sifparts::utils::EnsureDirOrThrow(storage / "file" / "nested"), sifparts::utils::FileException);
}

TEST_F(UtilsFileTest, IsRegularFile) {
  CreateFile(storage / "file", "x");
  fs::create_symlink(storage / "file", storage / "link");
  EXPECT_TRUE(sifparts::utils::IsRegularFile(storage / "file"));
  EXPECT_TRUE(sifparts::utils::IsRegularFile(storage / "link"));
  EXPECT_FALSE(sifparts::utils::IsRegularFile(storage));
  EXPECT_FALSE(sifparts::utils::IsRegularFile(storage / "missing"));
}

TEST_F(UtilsFileTest, OutputFileTruncates) {
  auto const path = storage / "file";
  CreateFile(path, "a much longer previous content");
  {
    sifparts::utils::OutputFile handle;
    handle.Open(path);
    ASSERT_TRUE(handle.IsOpen());
    ASSERT_EQ(handle.path(), path);
    handle.Write("short");
    EXPECT_EQ(handle.written(), 5);
    handle.Close();
    ASSERT_FALSE(handle.IsOpen());
    ASSERT_EQ(handle.path(), "");
  }
  EXPECT_EQ(ReadAll(path), "short");
}

TEST_F(UtilsFileTest, OutputFileClosedOnDestruction) {
  auto const path = storage / "file";
  {
    sifparts::utils::OutputFile handle;
    handle.Open(path);
    handle.Write("unclosed");
  }
  EXPECT_EQ(ReadAll(path), "unclosed");
}

TEST_F(UtilsFileTest, OutputFileOpenFailure) {
  sifparts::utils::OutputFile handle;
  ASSERT_THROW(handle.Open(storage / "missing" / "file"),
               sifparts::utils::FileException);
  ASSERT_FALSE(handle.IsOpen());
  ASSERT_EQ(handle.path(), "");
}

TEST_F(UtilsFileTest, OutputFileInvalidUsage) {
  sifparts::utils::OutputFile handle;
  ASSERT_DEATH(handle.Write("hello!"), "");
  // Closing an unopened handle is a no-op.
  handle.Close();
}

TEST_F(UtilsFileTest, InputFileRead) {
  auto const path = storage / "file";
  CreateFile(path, "0123456789");

  sifparts::utils::InputFile handle;
  ASSERT_FALSE(handle.Open(storage / "missing"));
  ASSERT_FALSE(handle.Open(storage));
  ASSERT_FALSE(handle.IsOpen());
  ASSERT_TRUE(handle.Open(path));
  ASSERT_EQ(handle.size(), 10);

  std::vector<uint8_t> data(8);
  ASSERT_EQ(handle.Read(data.data(), data.size()), 8);
  EXPECT_EQ(std::string(data.begin(), data.end()), "01234567");
  EXPECT_EQ(handle.offset(), 8);

  // Short read at the end, then nothing.
  ASSERT_EQ(handle.Read(data.data(), data.size()), 2);
  EXPECT_EQ(std::string(data.begin(), data.begin() + 2), "89");
  EXPECT_EQ(handle.Read(data.data(), data.size()), 0);
  EXPECT_EQ(handle.offset(), 10);

  handle.Close();
  ASSERT_FALSE(handle.IsOpen());
}

TEST_F(UtilsFileTest, CopyBytesAcrossBlockBoundary) {
  auto const input_path = storage / "input";
  std::string content(sifparts::utils::kCopyBlockSize * 2 + 17, '\0');
  for (size_t i = 0; i < content.size(); ++i) content[i] = static_cast<char>(i * 31 % 251);
  CreateFile(input_path, content);

  sifparts::utils::InputFile input;
  ASSERT_TRUE(input.Open(input_path));
  sifparts::utils::OutputFile output;
  output.Open(storage / "output");
  sifparts::utils::CopyBytes(input, output, content.size());
  output.Close();

  EXPECT_EQ(ReadAll(storage / "output"), content);
}

TEST_F(UtilsFileTest, CopyBytesShortInput) {
  CreateFile(storage / "input", "abc");
  sifparts::utils::InputFile input;
  ASSERT_TRUE(input.Open(storage / "input"));
  sifparts::utils::OutputFile output;
  output.Open(storage / "output");
  ASSERT_THROW(sifparts::utils::CopyBytes(input, output, 4), sifparts::utils::FileException);
  output.Close();
  // What was there is still copied.
  EXPECT_EQ(ReadAll(storage / "output"), "abc");
}
