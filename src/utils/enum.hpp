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

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace sifparts::utils {

/// Spelling of an enum value on the command line.
template <typename Enum>
using EnumName = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
std::optional<Enum> EnumFromName(std::string_view name, const std::array<EnumName<Enum>, N> &names) {
  for (const auto &[spelling, value] : names) {
    if (spelling == name) return value;
  }
  return std::nullopt;
}

/// "a, b, c" for help texts and error messages.
template <typename Enum, std::size_t N>
std::string EnumNames(const std::array<EnumName<Enum>, N> &names) {
  std::vector<std::string_view> spellings;
  spellings.reserve(N);
  for (const auto &entry : names) spellings.push_back(entry.first);
  return fmt::format("{}", fmt::join(spellings, ", "));
}

}  // namespace sifparts::utils
