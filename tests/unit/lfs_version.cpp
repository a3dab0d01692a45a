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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "lfs/version.hpp"

using namespace sifparts::lfs;

TEST(GitVersion, Extract) {
  EXPECT_EQ(ExtractGitVersion("git version 2.39.2\n"), "2.39.2");
  EXPECT_EQ(ExtractGitVersion("git version 2.39.2.windows.1"), "2.39.2");
  EXPECT_EQ(ExtractGitVersion("git version 2.37.1 (Apple Git-137.1)"), "2.37.1");
  EXPECT_EQ(ExtractGitVersion("git version 1.8.3.1"), "1.8.3.1");
  EXPECT_EQ(ExtractGitVersion("git version 2.43.0.rc1"), "2.43.0");
}

TEST(GitVersion, ExtractFailure) {
  EXPECT_EQ(ExtractGitVersion(""), std::nullopt);
  EXPECT_EQ(ExtractGitVersion("git version"), std::nullopt);
  EXPECT_EQ(ExtractGitVersion("git version unknown"), std::nullopt);
  EXPECT_EQ(ExtractGitVersion("git version ."), std::nullopt);
}

TEST(Version, Parse) {
  EXPECT_THAT(*ParseVersion("2.13.0"), ::testing::ElementsAre(2, 13, 0));
  EXPECT_THAT(*ParseVersion("10"), ::testing::ElementsAre(10));
  EXPECT_THAT(*ParseVersion("007.1"), ::testing::ElementsAre(7, 1));

  EXPECT_EQ(ParseVersion(""), std::nullopt);
  EXPECT_EQ(ParseVersion("2..3"), std::nullopt);
  EXPECT_EQ(ParseVersion("2.13."), std::nullopt);
  EXPECT_EQ(ParseVersion(".2"), std::nullopt);
  EXPECT_EQ(ParseVersion("2.x"), std::nullopt);
  EXPECT_EQ(ParseVersion("2.-1"), std::nullopt);
  EXPECT_EQ(ParseVersion("99999999999999999999"), std::nullopt);
}

TEST(Version, Less) {
  auto const less = [](std::string_view lhs, std::string_view rhs) {
    return VersionLess(*ParseVersion(lhs), *ParseVersion(rhs));
  };
  EXPECT_TRUE(less("2.9.0", "2.13.0"));
  EXPECT_FALSE(less("2.13.0", "2.9.0"));
  EXPECT_FALSE(less("2.13.0", "2.13.0"));
  EXPECT_FALSE(less("2.13", "2.13.0"));
  EXPECT_FALSE(less("2.13.0", "2.13"));
  EXPECT_TRUE(less("2.13", "2.13.1"));
  EXPECT_TRUE(less("1.8.3.1", "2"));
  EXPECT_FALSE(less("3", "2.99.99"));
}

TEST(Version, ToString) {
  EXPECT_EQ(VersionToString({2, 13, 0}), "2.13.0");
  EXPECT_EQ(VersionToString({}), "");
}
