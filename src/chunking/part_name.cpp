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

#include "chunking/part_name.hpp"

#include <fmt/format.h>

#include "utils/logging.hpp"

namespace sifparts::chunking {

std::string PartFileName(std::string_view prefix, uint64_t index, uint32_t digits) {
  return fmt::format("{}.{:0{}}{}", prefix, index, digits, kPartExtension);
}

std::optional<uint64_t> ParsePartIndex(std::string_view file_name, std::string_view prefix, uint32_t digits) {
  // prefix + '.' + digits + extension
  if (file_name.size() != prefix.size() + 1 + digits + kPartExtension.size()) return std::nullopt;
  if (!file_name.starts_with(prefix) || file_name[prefix.size()] != '.') return std::nullopt;
  if (!file_name.ends_with(kPartExtension)) return std::nullopt;

  auto const index = file_name.substr(prefix.size() + 1, digits);
  uint64_t value = 0;
  for (auto c : index) {
    if (c < '0' || c > '9') return std::nullopt;
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  return value;
}

uint64_t MaxIndex(uint32_t digits) {
  DSP_ASSERT(digits >= 1 && digits <= kMaxDigits, "Unsupported digit width {}", digits);
  uint64_t max = 1;
  for (uint32_t i = 0; i < digits; ++i) max *= 10;
  return max - 1;
}

std::string DefaultPrefix(const std::filesystem::path &input) {
  auto name = input.filename().string();
  if (name.ends_with(kPartExtension)) {
    name.resize(name.size() - kPartExtension.size());
  }
  return name;
}

bool IsValidPrefix(std::string_view prefix) {
  return !prefix.empty() && prefix != "." && prefix != ".." && prefix.find('/') == std::string_view::npos;
}

}  // namespace sifparts::chunking
