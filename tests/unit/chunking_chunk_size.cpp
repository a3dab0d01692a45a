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

#include <gtest/gtest.h>

#include "chunking/chunk_size.hpp"
#include "chunking/exceptions.hpp"

using sifparts::chunking::InvalidConfigurationException;
using sifparts::chunking::ParseChunkSize;

TEST(ChunkSize, PlainBytes) {
  EXPECT_EQ(ParseChunkSize("512"), 512);
  EXPECT_EQ(ParseChunkSize("1"), 1);
  EXPECT_EQ(ParseChunkSize(" 64 "), 64);
}

TEST(ChunkSize, Units) {
  EXPECT_EQ(ParseChunkSize("64k"), 64ULL * 1024);
  EXPECT_EQ(ParseChunkSize("64K"), 64ULL * 1024);
  EXPECT_EQ(ParseChunkSize("3m"), 3ULL * 1024 * 1024);
  EXPECT_EQ(ParseChunkSize("2G"), 2147483648ULL);
  EXPECT_EQ(ParseChunkSize("1t"), 1ULL << 40U);
  EXPECT_EQ(ParseChunkSize("2G"), sifparts::chunking::kDefaultChunkSize);
}

TEST(ChunkSize, Fractions) {
  EXPECT_EQ(ParseChunkSize("1.5k"), 1536);
  EXPECT_EQ(ParseChunkSize("0.5M"), 512ULL * 1024);
  EXPECT_EQ(ParseChunkSize(".5k"), 512);
  // Fractional bytes are truncated.
  EXPECT_EQ(ParseChunkSize("1.9"), 1);
  EXPECT_EQ(ParseChunkSize("1.0001k"), 1024);
}

TEST(ChunkSize, Invalid) {
  for (const auto *text : {"", "   ", "k", "abc", "-1", "1.2.3", "1x", "1kb", "1 k", "+5", "."}) {
    EXPECT_THROW(ParseChunkSize(text), InvalidConfigurationException) << text;
  }
}

TEST(ChunkSize, SmallerThanOneByte) {
  EXPECT_THROW(ParseChunkSize("0"), InvalidConfigurationException);
  EXPECT_THROW(ParseChunkSize("0k"), InvalidConfigurationException);
  EXPECT_THROW(ParseChunkSize("0.5"), InvalidConfigurationException);
}

TEST(ChunkSize, TooLarge) {
  EXPECT_THROW(ParseChunkSize("99999999999999999999"), InvalidConfigurationException);
  EXPECT_THROW(ParseChunkSize("20000000t"), InvalidConfigurationException);
  EXPECT_EQ(ParseChunkSize("18446744073709551615"), 18446744073709551615ULL);
}
