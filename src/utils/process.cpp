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

#include "utils/process.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <memory>

#include "utils/file.hpp"
#include "utils/logging.hpp"
#include "utils/string.hpp"

namespace sifparts::utils {

namespace {

bool IsExecutableFile(const std::filesystem::path &path) {
  return IsRegularFile(path) && access(path.c_str(), X_OK) == 0;
}

}  // namespace

std::string ShellQuote(std::string_view arg) {
  std::string quoted;
  quoted.reserve(arg.size() + 2);
  quoted += '\'';
  for (auto c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}

std::string BuildCommandLine(const std::vector<std::string> &args, const ExecOptions &options) {
  std::vector<std::string> parts;
  if (options.working_dir) {
    parts.emplace_back("cd " + ShellQuote(options.working_dir->string()) + " &&");
  }
  for (const auto &[key, value] : options.env) {
    parts.emplace_back(key + "=" + ShellQuote(value));
  }
  for (const auto &arg : args) {
    parts.emplace_back(ShellQuote(arg));
  }
  if (options.merge_stderr) {
    parts.emplace_back("2>&1");
  }
  return Join(parts, " ");
}

std::optional<CommandResult> Exec(const std::vector<std::string> &args, const ExecOptions &options) {
  SP_ASSERT(!args.empty(), "Exec needs at least the program name.");
  auto const command = BuildCommandLine(args, options);
  spdlog::debug("Running: {}", command);

  std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command.c_str(), "r"), pclose);
  if (!pipe) {
    spdlog::trace("Can't read process output.");
    return std::nullopt;
  }

  CommandResult result;
  std::array<char, 128> buffer;
  while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
    result.output += buffer.data();
  }

  auto const status = pclose(pipe.release());
  if (status == -1) {
    spdlog::trace("Couldn't collect the exit status of '{}'.", command);
    return std::nullopt;
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

std::optional<std::filesystem::path> FindExecutable(std::string_view name) {
  if (name.find('/') != std::string_view::npos) {
    std::filesystem::path candidate{name};
    if (IsExecutableFile(candidate)) return candidate;
    return std::nullopt;
  }

  auto const *path_env = std::getenv("PATH");
  if (path_env == nullptr) return std::nullopt;

  for (const auto &dir : Split(path_env, ":")) {
    auto candidate = std::filesystem::path(dir.empty() ? "." : dir) / name;
    if (IsExecutableFile(candidate)) return candidate;
  }
  return std::nullopt;
}

}  // namespace sifparts::utils
