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

#include "chunking/chunk_size.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

#include "chunking/exceptions.hpp"
#include "utils/string.hpp"

namespace sifparts::chunking {

namespace {

uint64_t UnitMultiplier(char unit, std::string_view text) {
  switch (tolower(static_cast<unsigned char>(unit))) {
    case 'k':
      return 1ULL << 10U;
    case 'm':
      return 1ULL << 20U;
    case 'g':
      return 1ULL << 30U;
    case 't':
      return 1ULL << 40U;
    default:
      throw InvalidConfigurationException("Invalid chunk size '{}': unknown unit '{}', expected one of k, m, g, t",
                                          text, unit);
  }
}

bool AllDigits(std::string_view s) {
  return std::all_of(s.begin(), s.end(), [](char c) { return isdigit(static_cast<unsigned char>(c)) != 0; });
}

}  // namespace

uint64_t ParseChunkSize(std::string_view text) {
  auto number = utils::Trim(text);
  if (number.empty()) {
    throw InvalidConfigurationException("Chunk size can't be empty");
  }

  uint64_t multiplier = 1;
  if (isalpha(static_cast<unsigned char>(number.back()))) {
    multiplier = UnitMultiplier(number.back(), text);
    number.remove_suffix(1);
  }

  auto const dot = number.find('.');
  auto const integral = number.substr(0, dot);
  auto const fraction = dot == std::string_view::npos ? std::string_view{} : number.substr(dot + 1);
  if ((integral.empty() && fraction.empty()) || !AllDigits(integral) || !AllDigits(fraction)) {
    throw InvalidConfigurationException("Invalid chunk size '{}'", text);
  }

  uint64_t whole = 0;
  if (!integral.empty()) {
    try {
      whole = utils::ParseUint64(integral);
    } catch (const utils::ParseException &) {
      throw InvalidConfigurationException("Chunk size '{}' is too large", text);
    }
  }
  if (whole > std::numeric_limits<uint64_t>::max() / multiplier) {
    throw InvalidConfigurationException("Chunk size '{}' is too large", text);
  }
  uint64_t bytes = whole * multiplier;

  if (!fraction.empty()) {
    auto const part = std::stold("0." + std::string(fraction)) * static_cast<long double>(multiplier);
    auto const extra = static_cast<uint64_t>(part);
    if (bytes > std::numeric_limits<uint64_t>::max() - extra) {
      throw InvalidConfigurationException("Chunk size '{}' is too large", text);
    }
    bytes += extra;
  }

  if (bytes < 1) {
    throw InvalidConfigurationException("Chunk size '{}' is smaller than one byte", text);
  }
  return bytes;
}

}  // namespace sifparts::chunking
