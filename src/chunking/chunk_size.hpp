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
#include <string_view>

namespace sifparts::chunking {

inline constexpr uint64_t kDefaultChunkSize = 2ULL * 1024 * 1024 * 1024;

/// Parses a size such as `512`, `64k`, `1.5M` or `2G` into bytes. Units
/// `k`, `m`, `g` and `t` are case-insensitive powers of 1024 and a
/// fractional result is truncated to whole bytes.
///
/// @throw InvalidConfigurationException if the text isn't a size or the size
///        is smaller than one byte
uint64_t ParseChunkSize(std::string_view text);

}  // namespace sifparts::chunking
