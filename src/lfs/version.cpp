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

#include "lfs/version.hpp"

#include <algorithm>

#include "utils/exceptions.hpp"
#include "utils/string.hpp"

namespace sifparts::lfs {

std::optional<std::string> ExtractGitVersion(std::string_view output) {
  auto const tokens = utils::SplitWords(output);
  if (tokens.size() < 3) return std::nullopt;

  std::string_view token = tokens[2];
  auto const end = std::find_if_not(token.begin(), token.end(), [](char c) { return (c >= '0' && c <= '9') || c == '.'; });
  token = token.substr(0, end - token.begin());
  if (token.ends_with('.')) token.remove_suffix(1);
  if (token.empty()) return std::nullopt;
  return std::string(token);
}

std::optional<Version> ParseVersion(std::string_view text) {
  if (text.empty()) return std::nullopt;
  Version version;
  for (const auto &segment : utils::Split(text, ".")) {
    try {
      version.push_back(utils::ParseUint64(segment));
    } catch (const utils::ParseException &) {
      return std::nullopt;
    }
  }
  return version;
}

bool VersionLess(const Version &lhs, const Version &rhs) {
  auto const size = std::max(lhs.size(), rhs.size());
  for (size_t i = 0; i < size; ++i) {
    auto const left = i < lhs.size() ? lhs[i] : 0;
    auto const right = i < rhs.size() ? rhs[i] : 0;
    if (left != right) return left < right;
  }
  return false;
}

std::string VersionToString(const Version &version) {
  std::vector<std::string> segments;
  segments.reserve(version.size());
  for (auto segment : version) segments.push_back(std::to_string(segment));
  return utils::Join(segments, ".");
}

}  // namespace sifparts::lfs
