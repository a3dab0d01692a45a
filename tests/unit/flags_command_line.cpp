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

#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "flags/chunking.hpp"
#include "flags/command_line.hpp"
#include "flags/lfs.hpp"
#include "flags/log_level.hpp"
#include "utils/file.hpp"

namespace fs = std::filesystem;
using ::testing::ElementsAre;

class FlagsCommandLineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Clear();
    fs::create_directories(storage);
  }

  void TearDown() override { Clear(); }

  static void Write(const fs::path &path, const std::string &content) {
    fs::create_directories(path.parent_path());
    std::ofstream stream(path);
    stream << content;
  }

  fs::path storage{fs::temp_directory_path() / (std::string("sifparts_test_unit_flags_command_line_") +
                                                ::testing::UnitTest::GetInstance()->current_test_info()->name())};

 private:
  void Clear() {
    if (fs::exists(storage)) fs::remove_all(storage);
  }
};

TEST(NormalizeFlagSpellings, HyphensBecomeUnderscores) {
  auto const arguments = sifparts::flags::NormalizeFlagSpellings(
      {"--out-dir=a-b", "--chunk-size", "1-k", "-in-dir", "--strict-sequence", "--", "--out-dir"});
  EXPECT_THAT(arguments,
              ElementsAre("--out_dir=a-b", "--chunk_size", "1-k", "-in-dir", "--strict_sequence", "--", "--out-dir"));
}

TEST(NormalizeFlagSpellings, LeavesOtherArgumentsAlone) {
  EXPECT_THAT(sifparts::flags::NormalizeFlagSpellings({"plain-value", "-", "--"}),
              ElementsAre("plain-value", "-", "--"));
  EXPECT_TRUE(sifparts::flags::NormalizeFlagSpellings({}).empty());
}

TEST(IsHelpArgument, Spellings) {
  EXPECT_TRUE(sifparts::flags::IsHelpArgument("-h"));
  EXPECT_TRUE(sifparts::flags::IsHelpArgument("-help"));
  EXPECT_TRUE(sifparts::flags::IsHelpArgument("--help"));
  EXPECT_FALSE(sifparts::flags::IsHelpArgument("help"));
  EXPECT_FALSE(sifparts::flags::IsHelpArgument("--helpful"));
  EXPECT_FALSE(sifparts::flags::IsHelpArgument("--helpshort"));
}

TEST(FlagsOfOtherCommands, SplitAndJoin) {
  std::vector<std::string_view> const split{"input", "prefix", "out_dir", "chunk_size"};
  std::vector<std::string_view> const join{"prefix", "in_dir", "output", "strict_sequence"};
  std::vector<std::string_view> all{split};
  all.insert(all.end(), join.begin(), join.end());

  EXPECT_THAT(sifparts::flags::FlagsOfOtherCommands({"--prefix", "x", "--chunk_size", "1k"}, join, all),
              ElementsAre("chunk_size"));
  EXPECT_THAT(sifparts::flags::FlagsOfOtherCommands({"--in_dir=a", "-output", "b"}, split, all),
              ElementsAre("in_dir", "output"));
  EXPECT_THAT(sifparts::flags::FlagsOfOtherCommands({"--nostrict_sequence"}, split, all),
              ElementsAre("strict_sequence"));
  EXPECT_TRUE(sifparts::flags::FlagsOfOtherCommands({"--nostrict_sequence", "--prefix=x"}, join, all).empty());
  // Flags no command owns are left to gflags.
  EXPECT_TRUE(sifparts::flags::FlagsOfOtherCommands({"--log_level=DEBUG", "--flagfile=x"}, join, all).empty());
  EXPECT_TRUE(sifparts::flags::FlagsOfOtherCommands({"--", "--chunk_size=1"}, join, all).empty());
}

TEST_F(FlagsCommandLineTest, ConfigFilesFromHome) {
  EXPECT_THAT(sifparts::flags::ConfigFiles(storage.c_str(), nullptr),
              ::testing::Not(::testing::Contains(storage / ".sifparts" / "config")));

  Write(storage / ".sifparts" / "config", "--chunk_size=1M\n");
  auto const files = sifparts::flags::ConfigFiles(storage.c_str(), "");
  ASSERT_FALSE(files.empty());
  EXPECT_EQ(files.back(), storage / ".sifparts" / "config");
}

TEST_F(FlagsCommandLineTest, ConfigFromEnvironmentComesLast) {
  Write(storage / ".sifparts" / "config", "--digits=4\n");
  Write(storage / "extra.conf", "--digits=6\n");
  auto const files = sifparts::flags::ConfigFiles(storage.c_str(), (storage / "extra.conf").c_str());
  ASSERT_GE(files.size(), 2);
  EXPECT_EQ(files[files.size() - 2], storage / ".sifparts" / "config");
  EXPECT_EQ(files.back(), storage / "extra.conf");

  EXPECT_THROW(sifparts::flags::ConfigFiles(nullptr, (storage / "absent.conf").c_str()),
               sifparts::utils::FileException);
  EXPECT_THROW(sifparts::flags::ConfigFiles(nullptr, storage.c_str()), sifparts::utils::FileException);
}

TEST_F(FlagsCommandLineTest, LoadConfigFilesInOrder) {
  gflags::FlagSaver saver;
  Write(storage / "first.conf", "--digits=4\n--prefix=first\n");
  Write(storage / "second.conf", "--digits=6\n");

  sifparts::flags::LoadConfigFiles({storage / "first.conf", storage / "second.conf"}, "sifparts");
  EXPECT_EQ(FLAGS_digits, 6);
  EXPECT_EQ(FLAGS_prefix, "first");
}

TEST(InstallerConfigFromFlags, MinGitVersionOverride) {
  gflags::FlagSaver saver;
  FLAGS_lfs_bin_dir = "/opt/tools/bin";

  auto const defaults = sifparts::flags::InstallerConfigFromFlags(nullptr);
  EXPECT_EQ(defaults.min_git_version, sifparts::lfs::InstallerConfig{}.min_git_version);
  EXPECT_EQ(defaults.bin_dir, "/opt/tools/bin");
  EXPECT_EQ(sifparts::flags::InstallerConfigFromFlags("").min_git_version, defaults.min_git_version);
  EXPECT_EQ(sifparts::flags::InstallerConfigFromFlags("2.40.1").min_git_version, "2.40.1");
}

TEST(InstallerConfigFromFlags, DownloadTimeout) {
  gflags::FlagSaver saver;
  FLAGS_lfs_download_timeout_sec = 5;
  EXPECT_EQ(sifparts::flags::InstallerConfigFromFlags(nullptr).download_timeout_sec, 5);
}

TEST(LogLevelFromName, Names) {
  EXPECT_EQ(sifparts::flags::LogLevelFromName("DEBUG"), spdlog::level::debug);
  EXPECT_EQ(sifparts::flags::LogLevelFromName("WARNING"), spdlog::level::warn);
  EXPECT_EQ(sifparts::flags::LogLevelFromName("verbose"), std::nullopt);
}

TEST(FlagValidators, RejectInvalidValues) {
  gflags::FlagSaver saver;
  EXPECT_TRUE(gflags::SetCommandLineOption("digits", "0").empty());
  EXPECT_TRUE(gflags::SetCommandLineOption("splitter", "fast").empty());
  EXPECT_TRUE(gflags::SetCommandLineOption("log_level", "LOUD").empty());
  EXPECT_TRUE(gflags::SetCommandLineOption("lfs_platform", "").empty());
  EXPECT_FALSE(gflags::SetCommandLineOption("digits", "8").empty());
  EXPECT_EQ(FLAGS_digits, 8);
}
