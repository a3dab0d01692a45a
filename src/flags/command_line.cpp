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

#include "flags/command_line.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>

#include <gflags/gflags.h>
#include <spdlog/spdlog.h>

#include "utils/file.hpp"

namespace sifparts::flags {

namespace {

constexpr std::string_view kSystemConfig = "/etc/sifparts/sifparts.conf";
constexpr std::string_view kUserConfig = ".sifparts/config";
constexpr std::string_view kEndOfFlags = "--";

/// "--name=value", "-name" or "--name" gives "name".
std::optional<std::string_view> FlagName(std::string_view argument) {
  if (!argument.starts_with('-') || argument == "-" || argument == kEndOfFlags) return std::nullopt;
  argument.remove_prefix(argument.starts_with("--") ? 2 : 1);
  return argument.substr(0, argument.find('='));
}

bool Contains(const std::vector<std::string_view> &names, std::string_view name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

std::vector<std::string> NormalizeFlagSpellings(std::vector<std::string> arguments) {
  for (auto &argument : arguments) {
    if (argument == kEndOfFlags) break;
    if (!argument.starts_with("--")) continue;
    auto const name_end = std::min(argument.find('='), argument.size());
    std::replace(argument.begin() + 2, argument.begin() + static_cast<std::ptrdiff_t>(name_end), '-', '_');
  }
  return arguments;
}

bool IsHelpArgument(std::string_view argument) { return argument == "-h" || argument == "-help" || argument == "--help"; }

std::vector<std::filesystem::path> ConfigFiles(const char *home, const char *config_env) {
  std::vector<std::filesystem::path> candidates{std::filesystem::path(kSystemConfig)};
  if (home != nullptr && *home != '\0') candidates.push_back(std::filesystem::path(home) / kUserConfig);

  std::vector<std::filesystem::path> files;
  for (auto &candidate : candidates) {
    if (utils::IsRegularFile(candidate)) files.push_back(std::move(candidate));
  }
  if (config_env != nullptr && *config_env != '\0') {
    if (!utils::IsRegularFile(config_env)) {
      throw utils::FileException("SIFPARTS_CONFIG points to '{}', which isn't a file", config_env);
    }
    files.emplace_back(config_env);
  }
  return files;
}

void LoadConfigFiles(const std::vector<std::filesystem::path> &files, const char *program_name) {
  for (const auto &file : files) {
    spdlog::debug("Reading flags from {}", file.string());
    if (!gflags::ReadFromFlagsFile(file.string(), program_name, true)) {
      throw utils::FileException("Couldn't read flags from {}", file.string());
    }
  }
}

std::vector<std::string> FlagsOfOtherCommands(const std::vector<std::string> &arguments,
                                              const std::vector<std::string_view> &own_flags,
                                              const std::vector<std::string_view> &command_flags) {
  std::vector<std::string> foreign;
  for (const auto &argument : arguments) {
    if (argument == kEndOfFlags) break;
    auto name = FlagName(argument);
    if (!name) continue;
    if (!Contains(command_flags, *name) && name->starts_with("no")) name->remove_prefix(2);
    if (Contains(command_flags, *name) && !Contains(own_flags, *name)) foreign.emplace_back(*name);
  }
  return foreign;
}

}  // namespace sifparts::flags
