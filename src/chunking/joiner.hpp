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

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "chunking/part_name.hpp"

namespace sifparts::chunking {

struct JoinOptions {
  std::string prefix;
  std::filesystem::path in_dir{"."};
  /// Empty means `<prefix>.sif`.
  std::filesystem::path output;
  uint32_t digits{kDefaultDigits};
  /// Refuse to join when the found indices have holes.
  bool strict_sequence{false};
};

/// Run of consecutive absent indices, `first <= last`.
struct IndexGap {
  uint64_t first;
  uint64_t last;

  bool operator==(const IndexGap &) const = default;
};

struct JoinResult {
  std::filesystem::path parts_dir;
  std::filesystem::path output;
  std::vector<std::filesystem::path> parts;
  /// Indices missing between the first and the last found part.
  std::vector<IndexGap> gaps;
  uint64_t bytes_written{0};
};

/// `<in_dir>/<prefix>` if that directory exists, `in_dir` otherwise.
std::filesystem::path ResolvePartsDir(const std::filesystem::path &in_dir, const std::string &prefix);

/// Regular files in `parts_dir` named `<prefix>.<digits digits>.sif`, in
/// byte-wise lexicographic order of their names.
std::vector<std::filesystem::path> FindParts(const std::filesystem::path &parts_dir, const std::string &prefix,
                                             uint32_t digits);

/// Runs of indices absent between the smallest and the largest of
/// `sorted_indices`. One entry per run however wide it is.
std::vector<IndexGap> FindGaps(const std::vector<uint64_t> &sorted_indices);

/// "3, 5-9" style listing for messages.
std::string FormatGaps(const std::vector<IndexGap> &gaps);

/// Concatenates the parts of `options.prefix` into `options.output`,
/// truncating it first. Parts aren't checked for contiguity unless
/// `strict_sequence` is set; a gap is only logged.
///
/// @throw InputNotFoundException if `in_dir` doesn't exist
/// @throw NoPartsFoundException if no part matches, no output is created then
/// @throw InvalidConfigurationException on a bad prefix, or on a gap in strict mode
/// @throw utils::FileException
JoinResult Join(const JoinOptions &options);

}  // namespace sifparts::chunking
