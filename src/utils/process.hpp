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

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sifparts::utils {

struct CommandResult {
  /// Exit status of the command, or 128 + signal number if it was killed.
  int exit_code{0};
  /// Everything the command wrote to stdout, and to stderr when merged.
  std::string output;

  bool Succeeded() const { return exit_code == 0; }
};

struct ExecOptions {
  std::optional<std::filesystem::path> working_dir;
  std::vector<std::pair<std::string, std::string>> env;
  bool merge_stderr{true};
};

/// Quotes a single argument for a POSIX shell.
std::string ShellQuote(std::string_view arg);

/// Builds the shell command line used by `Exec` for the given arguments and
/// options.
std::string BuildCommandLine(const std::vector<std::string> &args, const ExecOptions &options = {});

/// Runs the command through the shell and collects its output. Returns
/// `std::nullopt` if the process couldn't be started.
std::optional<CommandResult> Exec(const std::vector<std::string> &args, const ExecOptions &options = {});

/// Looks `name` up in the directories listed in `PATH` and returns the first
/// executable regular file found.
std::optional<std::filesystem::path> FindExecutable(std::string_view name);

}  // namespace sifparts::utils
