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

#include <optional>
#include <string_view>

#include <gflags/gflags.h>
#include <spdlog/common.h>

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_string(log_level);
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_string(log_file);

namespace sifparts::flags {

/// TRACE, DEBUG, INFO, WARNING, ERROR or CRITICAL.
std::optional<spdlog::level::level_enum> LogLevelFromName(std::string_view name);

/// Replaces the default logger with one that writes to stderr and, when
/// `--log_file` is set, also to that file.
///
/// @throw spdlog::spdlog_ex if the log file can't be opened
void InitializeLogger();

}  // namespace sifparts::flags
