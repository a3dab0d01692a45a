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
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sifparts::lfs {

/// Dotted numeric version, most significant segment first.
using Version = std::vector<uint64_t>;

/// Pulls the version out of `git --version` output. The third whitespace
/// separated token is cut at the first character that isn't a digit or a dot
/// and one trailing dot is dropped, so `git version 2.39.2.windows.1` gives
/// `2.39.2`.
std::optional<std::string> ExtractGitVersion(std::string_view output);

/// Every dot separated segment has to be a non-empty run of decimal digits.
std::optional<Version> ParseVersion(std::string_view text);

/// Missing trailing segments compare as zero, so `2.13` equals `2.13.0`.
bool VersionLess(const Version &lhs, const Version &rhs);

std::string VersionToString(const Version &version);

}  // namespace sifparts::lfs
