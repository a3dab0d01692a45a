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
#include <cstdint>
#include <string>

#include <spdlog/spdlog.h>

#include "utils/enum.hpp"

// Validators registered with DEFINE_validator. A failed validation is logged
// here, gflags then refuses the value and exits.
namespace sifparts::flags {

template <int32_t lower, int32_t upper>
bool ValidateInRange(const char *flag_name, int32_t value) {
  if (value >= lower && value <= upper) return true;
  spdlog::error("--{} has to be in range [{}, {}], got {}", flag_name, lower, upper, value);
  return false;
}

inline bool ValidateNotEmpty(const char *flag_name, const std::string &value) {
  if (!value.empty()) return true;
  spdlog::error("--{} can't be empty", flag_name);
  return false;
}

template <typename Enum, std::size_t N>
bool ValidateEnumName(const char *flag_name, const std::string &value,
                      const std::array<utils::EnumName<Enum>, N> &names) {
  if (utils::EnumFromName(value, names)) return true;
  spdlog::error("--{} has to be one of {}, got '{}'", flag_name, utils::EnumNames(names), value);
  return false;
}

}  // namespace sifparts::flags
