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

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "utils/exceptions.hpp"
#include "utils/readable_size.hpp"
#include "utils/string.hpp"

using vec = std::vector<std::string>;

using namespace sifparts::utils;

TEST(String, Trim) {
  EXPECT_EQ(Trim(" \t\n\r vllm\r\n\t sif \r\t "), "vllm\r\n\t sif");
  EXPECT_EQ(Trim(" \t\n\r"), "");
  EXPECT_EQ(Trim("2G"), "2G");
  EXPECT_EQ(Trim(""), "");
}

// Bytes of UTF-8 sequences are negative as plain char.
TEST(String, TrimKeepsHighBytes) {
  EXPECT_EQ(Trim(" \xc3\xa9t\xc3\xa9 "), "\xc3\xa9t\xc3\xa9");
  EXPECT_EQ(Trim("\xff"), "\xff");
  EXPECT_EQ(SplitWords("\xa0 \xe2\x80\x83"), vec({"\xa0", "\xe2\x80\x83"}));
}

TEST(String, Join) {
  EXPECT_EQ(Join(vec{}, " "), "");
  EXPECT_EQ(Join(vec{"2", "13", "0"}, "."), "2.13.0");
  EXPECT_EQ(Join(vec{"split", "-b", "1024"}, " "), "split -b 1024");
  EXPECT_EQ(Join(vec{"", "abc", "", "def", ""}, " "), " abc  def ");
}

TEST(String, Split) {
  EXPECT_EQ(Split("aba", "a"), vec({"", "b", ""}));
  EXPECT_EQ(Split("2.13.0", "."), vec({"2", "13", "0"}));
  EXPECT_EQ(Split("/usr/bin::/bin", ":"), vec({"/usr/bin", "", "/bin"}));
  EXPECT_EQ(Split("a::b", "::"), vec({"a", "b"}));
  EXPECT_EQ(Split("aba", "c"), vec{"aba"});
  EXPECT_EQ(Split("", "."), vec{});
}

TEST(String, SplitWords) {
  EXPECT_EQ(SplitWords(" "), vec({}));
  EXPECT_EQ(SplitWords(""), vec({}));
  EXPECT_EQ(SplitWords("git version 2.39.2\n"), vec({"git", "version", "2.39.2"}));
  EXPECT_EQ(SplitWords("  a \t b  "), vec({"a", "b"}));
}

TEST(String, ParseUint64) {
  EXPECT_EQ(ParseUint64("0"), 0);
  EXPECT_EQ(ParseUint64("00042"), 42);
  EXPECT_EQ(ParseUint64("18446744073709551615"), 18446744073709551615ULL);
  EXPECT_THROW(ParseUint64(""), ParseException);
  EXPECT_THROW(ParseUint64("-1"), ParseException);
  EXPECT_THROW(ParseUint64("+1"), ParseException);
  EXPECT_THROW(ParseUint64("12a"), ParseException);
  EXPECT_THROW(ParseUint64(" 12"), ParseException);
  EXPECT_THROW(ParseUint64("18446744073709551616"), ParseException);
}

TEST(ReadableSize, Units) {
  EXPECT_EQ(ReadableSize(0), "0 B");
  EXPECT_EQ(ReadableSize(1023), "1023 B");
  EXPECT_EQ(ReadableSize(1536), "1.50 KiB");
  EXPECT_EQ(ReadableSize(2147483648ULL), "2.00 GiB");
  EXPECT_EQ(ReadableSize(uint64_t{3} << 40U), "3.00 TiB");
  EXPECT_EQ(ReadableSize(uint64_t{5} << 50U), "5120.00 TiB");
}
