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

#include "utils/readable_size.hpp"

#include <array>
#include <cstddef>
#include <string_view>

#include <fmt/format.h>

namespace sifparts::utils {

std::string ReadableSize(uint64_t bytes) {
  constexpr std::array<std::string_view, 5> kUnits{"B", "KiB", "MiB", "GiB", "TiB"};
  size_t unit = 0;
  while (unit + 1 < kUnits.size() && bytes >> (10 * (unit + 1)) != 0) ++unit;
  if (unit == 0) return fmt::format("{} B", bytes);
  auto const scale = static_cast<double>(uint64_t{1} << (10 * unit));
  return fmt::format("{:.2f} {}", static_cast<double>(bytes) / scale, kUnits[unit]);
}

}  // namespace sifparts::utils
