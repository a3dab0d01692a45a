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

#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "utils/exceptions.hpp"

namespace sifparts::utils {

inline bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

inline std::string_view Trim(std::string_view s) {
  while (!s.empty() && IsSpace(s.front())) s.remove_prefix(1);
  while (!s.empty() && IsSpace(s.back())) s.remove_suffix(1);
  return s;
}

/// Pieces of `s` between occurrences of `delimiter`, empty pieces included.
/// An empty `s` has no pieces.
inline std::vector<std::string> Split(std::string_view s, std::string_view delimiter) {
  std::vector<std::string> pieces;
  if (s.empty()) return pieces;
  for (auto end = s.find(delimiter); end != std::string_view::npos; end = s.find(delimiter)) {
    pieces.emplace_back(s.substr(0, end));
    s.remove_prefix(end + delimiter.size());
  }
  pieces.emplace_back(s);
  return pieces;
}

/// Runs of non-whitespace characters of `s`.
inline std::vector<std::string> SplitWords(std::string_view s) {
  std::vector<std::string> words;
  while (true) {
    s = Trim(s);
    if (s.empty()) return words;
    size_t length = 0;
    while (length < s.size() && !IsSpace(s[length])) ++length;
    words.emplace_back(s.substr(0, length));
    s.remove_prefix(length);
  }
}

template <typename Range>
std::string Join(const Range &pieces, std::string_view separator) {
  return fmt::format("{}", fmt::join(pieces, separator));
}

/// The whole of `s` as a decimal unsigned 64 bit number.
///
/// @throw ParseException on an empty string, anything but digits or overflow
inline uint64_t ParseUint64(std::string_view s) {
  uint64_t value = 0;
  auto const [end, error] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (s.empty() || error != std::errc{} || end != s.data() + s.size()) throw ParseException(s);
  return value;
}

}  // namespace sifparts::utils
