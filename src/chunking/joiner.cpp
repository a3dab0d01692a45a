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

#include "chunking/joiner.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "chunking/exceptions.hpp"
#include "utils/file.hpp"
#include "utils/logging.hpp"
#include "utils/readable_size.hpp"

namespace sifparts::chunking {

namespace fs = std::filesystem;

fs::path ResolvePartsDir(const fs::path &in_dir, const std::string &prefix) {
  auto nested = in_dir / prefix;
  if (utils::DirExists(nested)) return nested;
  return in_dir;
}

std::vector<fs::path> FindParts(const fs::path &parts_dir, const std::string &prefix, uint32_t digits) {
  std::vector<std::string> names;
  std::error_code error_code;
  for (auto it = fs::directory_iterator(parts_dir, error_code); !error_code && it != fs::directory_iterator();
       it.increment(error_code)) {
    auto name = it->path().filename().string();
    if (!ParsePartIndex(name, prefix, digits)) continue;
    if (!utils::IsRegularFile(it->path())) continue;
    names.emplace_back(std::move(name));
  }
  if (error_code) {
    throw utils::FileException("Couldn't list {}: {}", parts_dir.string(), error_code.message());
  }

  // std::string compares bytes, the same order as `LC_ALL=C sort`.
  std::sort(names.begin(), names.end());

  std::vector<fs::path> parts;
  parts.reserve(names.size());
  for (const auto &name : names) {
    parts.emplace_back(parts_dir / name);
  }
  return parts;
}

std::vector<IndexGap> FindGaps(const std::vector<uint64_t> &sorted_indices) {
  std::vector<IndexGap> gaps;
  for (size_t i = 1; i < sorted_indices.size(); ++i) {
    if (sorted_indices[i] - sorted_indices[i - 1] > 1) {
      gaps.push_back(IndexGap{.first = sorted_indices[i - 1] + 1, .last = sorted_indices[i] - 1});
    }
  }
  return gaps;
}

std::string FormatGaps(const std::vector<IndexGap> &gaps) {
  std::vector<std::string> ranges;
  ranges.reserve(gaps.size());
  for (const auto &gap : gaps) {
    ranges.emplace_back(gap.first == gap.last ? fmt::format("{}", gap.first)
                                              : fmt::format("{}-{}", gap.first, gap.last));
  }
  return fmt::format("{}", fmt::join(ranges, ", "));
}

JoinResult Join(const JoinOptions &options) {
  if (!IsValidPrefix(options.prefix)) {
    throw InvalidConfigurationException("A valid prefix is required, got '{}'", options.prefix);
  }
  if (options.digits < 1 || options.digits > kMaxDigits) {
    throw InvalidConfigurationException("Digits must be in range [1, {}], got {}", kMaxDigits, options.digits);
  }
  if (!utils::DirExists(options.in_dir)) {
    throw InputNotFoundException("Input directory not found: {}", options.in_dir.string());
  }

  JoinResult result;
  result.parts_dir = ResolvePartsDir(options.in_dir, options.prefix);
  result.output = options.output.empty() ? fs::path(options.prefix + std::string(kPartExtension)) : options.output;
  result.parts = FindParts(result.parts_dir, options.prefix, options.digits);
  if (result.parts.empty()) {
    throw NoPartsFoundException("No parts found for prefix '{}' in {}", options.prefix, result.parts_dir.string());
  }

  std::vector<uint64_t> indices;
  indices.reserve(result.parts.size());
  for (const auto &part : result.parts) {
    indices.push_back(*ParsePartIndex(part.filename().string(), options.prefix, options.digits));
  }
  result.gaps = FindGaps(indices);
  if (!result.gaps.empty()) {
    if (options.strict_sequence) {
      throw InvalidConfigurationException("Parts of '{}' in {} are missing indices: {}", options.prefix,
                                          result.parts_dir.string(), FormatGaps(result.gaps));
    }
    spdlog::warn("Parts of '{}' are missing indices {}, the joined file will be incomplete.", options.prefix,
                 FormatGaps(result.gaps));
  }

  utils::OutputFile output;
  output.Open(result.output);
  for (const auto &part : result.parts) {
    utils::InputFile input;
    if (!input.Open(part)) {
      throw utils::FileException("Couldn't open part {} for reading", part.string());
    }
    utils::CopyBytes(input, output, input.size());
    spdlog::debug("Appended {} ({})", part.string(), utils::ReadableSize(input.size()));
  }
  result.bytes_written = output.written();
  output.Close();

  spdlog::info("Joined {} part(s) from {} into {} ({}).", result.parts.size(), result.parts_dir.string(),
               result.output.string(), utils::ReadableSize(result.bytes_written));
  return result;
}

}  // namespace sifparts::chunking
