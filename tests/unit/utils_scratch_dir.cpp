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

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "utils/file.hpp"
#include "utils/scratch_dir.hpp"

namespace fs = std::filesystem;

class ScratchDirTest : public ::testing::Test {
 protected:
  void SetUp() override {
    fs::remove_all(base);
    fs::create_directories(base);
  }

  void TearDown() override { fs::remove_all(base); }

  fs::path base{fs::temp_directory_path() /
                (std::string("sifparts_test_unit_utils_scratch_dir_") +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name())};
};

TEST_F(ScratchDirTest, UniqueAndRemovedWithContents) {
  fs::path first_path;
  {
    sifparts::utils::ScratchDir first("lfs", base);
    sifparts::utils::ScratchDir second("lfs", base);
    first_path = first.path();
    EXPECT_NE(first.path(), second.path());
    EXPECT_EQ(first.path().parent_path(), base);
    EXPECT_EQ(first.path().filename().string().rfind("lfs.", 0), 0);
    ASSERT_TRUE(fs::is_directory(first.path()));

    fs::create_directories(first.path() / "git-lfs-3.5.1");
    std::ofstream(first.path() / "git-lfs-3.5.1" / "install.sh") << "#!/bin/sh\n";
  }
  EXPECT_FALSE(fs::exists(first_path));
  EXPECT_TRUE(fs::is_empty(base));
}

TEST_F(ScratchDirTest, RemovedWhenUnwinding) {
  fs::path path;
  try {
    sifparts::utils::ScratchDir scratch("lfs", base);
    path = scratch.path();
    throw std::runtime_error("download failed");
  } catch (const std::runtime_error &) {
  }
  EXPECT_FALSE(path.empty());
  EXPECT_FALSE(fs::exists(path));
}

TEST_F(ScratchDirTest, DefaultsToSystemTemporaryDirectory) {
  sifparts::utils::ScratchDir scratch("sifparts_test_unit_utils_scratch_dir");
  EXPECT_TRUE(fs::equivalent(scratch.path().parent_path(), fs::temp_directory_path()));
}

TEST_F(ScratchDirTest, MissingBase) {
  EXPECT_THROW(sifparts::utils::ScratchDir("lfs", base / "missing"), sifparts::utils::FileException);
}
