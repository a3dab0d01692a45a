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
#include <string>
#include <string_view>
#include <vector>

namespace sifparts::flags {

/// gflags only knows underscores in flag names. Rewrites `--out-dir=x` to
/// `--out_dir=x` for every argument up to a `--` terminator, values are
/// left untouched.
std::vector<std::string> NormalizeFlagSpellings(std::vector<std::string> arguments);

/// -h, -help or --help.
bool IsHelpArgument(std::string_view argument);

/// Flag files read before the command line, lowest priority first:
/// /etc/sifparts/sifparts.conf, `home`/.sifparts/config and `config_env`.
/// Files that don't exist are skipped, except `config_env` which has to exist.
/// `home` and `config_env` may be null.
///
/// @throw utils::FileException if `config_env` names a missing file
std::vector<std::filesystem::path> ConfigFiles(const char *home, const char *config_env);

/// Applies every file of `files` as a gflags flag file. Exits the process
/// on an unknown flag or an invalid value, as command line parsing does.
///
/// @throw utils::FileException if a file can't be read
void LoadConfigFiles(const std::vector<std::filesystem::path> &files, const char *program_name);

/// Flags set in `arguments` that belong to another command: they're in
/// `command_flags` of some command but not in `own_flags`. Negated booleans
/// (`--nostrict_sequence`) count as the flag they negate.
std::vector<std::string> FlagsOfOtherCommands(const std::vector<std::string> &arguments,
                                              const std::vector<std::string_view> &own_flags,
                                              const std::vector<std::string_view> &command_flags);

}  // namespace sifparts::flags
