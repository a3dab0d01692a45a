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
#include <optional>
#include <string>
#include <string_view>

namespace sifparts::chunking {

inline constexpr std::string_view kPartExtension = ".sif";
inline constexpr uint32_t kDefaultDigits = 5;
inline constexpr uint64_t kDefaultStartIndex = 1;
/// Widest index that still fits into an unsigned 64 bit counter.
inline constexpr uint32_t kMaxDigits = 19;

/// `<prefix>.<index zero-padded to digits>.sif`
std::string PartFileName(std::string_view prefix, uint64_t index, uint32_t digits);

/// Returns the index encoded in `file_name` if it is named exactly
/// `<prefix>.<digits decimal digits>.sif`.
std::optional<uint64_t> ParsePartIndex(std::string_view file_name, std::string_view prefix, uint32_t digits);

/// Largest index representable with `digits` decimal digits.
uint64_t MaxIndex(uint32_t digits);

/// Base name of `input` with one trailing `.sif` removed.
std::string DefaultPrefix(const std::filesystem::path &input);

/// A prefix names a directory and a file name stem, so it can't be empty, a
/// dot entry or contain a path separator.
bool IsValidPrefix(std::string_view prefix);

}  // namespace sifparts::chunking
