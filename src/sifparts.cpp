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

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gflags/gflags.h>
#include <spdlog/spdlog.h>

#include "chunking/joiner.hpp"
#include "chunking/splitter.hpp"
#include "flags/chunking.hpp"
#include "flags/command_line.hpp"
#include "flags/lfs.hpp"
#include "flags/log_level.hpp"
#include "lfs/installer.hpp"
#include "lfs/system_collaborators.hpp"
#include "requests/requests.hpp"
#include "utils/exceptions.hpp"
#include "utils/file.hpp"
#include "utils/logging.hpp"
#include "version.hpp"

namespace {

constexpr std::string_view kUsage = R"(Usage:
  sifparts split --input /path/to/file.sif [options]
  sifparts join --prefix vllm [options]
  sifparts install-lfs

Commands:
  split        Split a SIF into numeric parts like vllm/vllm.00001.sif
  join         Reassemble parts into a single .sif file
  install-lfs  Install Git LFS locally to ~/bin if missing

Examples:
  sifparts split --input /path/to/vllm.sif --prefix vllm
  sifparts join --prefix vllm --output vllm.sif
  sifparts install-lfs

Run 'sifparts <command> --help' for the options of a command.)";

constexpr const char *kConfigEnv = "SIFPARTS_CONFIG";

struct Command {
  std::string_view name;
  std::string_view summary;
  std::vector<std::string_view> flags;
  int (*run)();
};

int RunSplit() {
  auto const options = sifparts::flags::SplitOptionsFromFlags();
  auto const splitter = sifparts::chunking::MakeSplitter(sifparts::flags::SplitterKindFromFlags());
  auto const result = sifparts::chunking::Split(options, *splitter);
  for (const auto &part : result.parts) {
    std::cout << part.string() << '\n';
  }
  return 0;
}

int RunJoin() {
  sifparts::chunking::Join(sifparts::flags::JoinOptionsFromFlags());
  return 0;
}

int RunInstallLfs() {
  auto const config = sifparts::flags::InstallerConfigFromFlags(std::getenv(sifparts::flags::kMinGitVersionEnv));

  sifparts::requests::Init();
  sifparts::lfs::GitCli git;
  sifparts::lfs::CurlDownloader downloader(config.download_timeout_sec);
  sifparts::lfs::TarArchiver archiver;
  sifparts::lfs::GithubReleaseIndex release_index(config.release_index_url, config.download_timeout_sec);
  sifparts::lfs::InstallScriptRunner script_runner;

  sifparts::lfs::LfsInstaller installer(
      config, {.version_control = git,
               .downloader = downloader,
               .archiver = archiver,
               .release_index = release_index,
               .script_runner = script_runner});
  auto const status = installer.Run();
  if (!status) {
    spdlog::error("{}: {}", sifparts::lfs::InstallErrorKindToString(status.error().kind), status.error().message);
    return 1;
  }
  spdlog::debug("git-lfs install finished with {}.", sifparts::lfs::InstallStatusToString(*status));
  return 0;
}

const std::vector<Command> &Commands() {
  static const std::vector<Command> commands{
      {"split",
       "Split a SIF into numeric parts like vllm/vllm.00001.sif",
       {"input", "prefix", "out_dir", "chunk_size", "digits", "start", "splitter"},
       &RunSplit},
      {"join",
       "Reassemble parts into a single .sif file",
       {"prefix", "in_dir", "output", "digits", "strict_sequence"},
       &RunJoin},
      {"install-lfs",
       "Install Git LFS locally to ~/bin if missing",
       {"lfs_bin_dir", "lfs_platform", "lfs_release_index_url", "lfs_download_timeout_sec"},
       &RunInstallLfs},
  };
  return commands;
}

const Command *FindCommand(std::string_view name) {
  for (const auto &command : Commands()) {
    if (command.name == name) return &command;
  }
  return nullptr;
}

void PrintCommandUsage(const Command &command) {
  std::cout << "Usage: sifparts " << command.name << " [options]\n\n" << command.summary << "\n\nOptions:\n";
  std::vector<std::string_view> flags = command.flags;
  flags.emplace_back("log_level");
  flags.emplace_back("log_file");
  for (const auto flag : flags) {
    std::cout << gflags::DescribeOneFlag(gflags::GetCommandLineFlagInfoOrDie(std::string(flag).c_str()));
  }
}

std::vector<std::string_view> AllCommandFlags() {
  std::vector<std::string_view> flags;
  for (const auto &command : Commands()) {
    flags.insert(flags.end(), command.flags.begin(), command.flags.end());
  }
  return flags;
}

}  // namespace

int main(int argc, char **argv) {
  gflags::SetUsageMessage(std::string(kUsage));
  gflags::SetVersionString(version_string);
  sifparts::logging::RedirectToStderr();

  if (argc < 2) {
    spdlog::error("Missing command.");
    std::cerr << kUsage << std::endl;
    return 1;
  }
  std::string_view const command_name = argv[1];
  if (sifparts::flags::IsHelpArgument(command_name)) {
    std::cout << kUsage << std::endl;
    return 0;
  }
  auto const *command = FindCommand(command_name);
  if (command == nullptr) {
    spdlog::error("Unknown command: {}", command_name);
    std::cerr << kUsage << std::endl;
    return 1;
  }

  // The command itself isn't a flag, gflags sees the program name and the
  // remaining arguments.
  std::vector<std::string> arguments{argv + 2, argv + argc};
  for (const auto &argument : arguments) {
    if (argument == "--") break;
    if (sifparts::flags::IsHelpArgument(argument)) {
      PrintCommandUsage(*command);
      return 0;
    }
  }
  arguments = sifparts::flags::NormalizeFlagSpellings(std::move(arguments));
  auto const foreign_flags = sifparts::flags::FlagsOfOtherCommands(arguments, command->flags, AllCommandFlags());
  if (!foreign_flags.empty()) {
    spdlog::error("'{}' doesn't take --{}", command->name, foreign_flags.front());
    PrintCommandUsage(*command);
    return 1;
  }
  arguments.insert(arguments.begin(), argv[0]);

  std::vector<char *> flag_argv;
  flag_argv.reserve(arguments.size() + 1);
  for (auto &argument : arguments) flag_argv.push_back(argument.data());
  flag_argv.push_back(nullptr);
  int flag_argc = static_cast<int>(arguments.size());
  char **flag_argv_data = flag_argv.data();

  try {
    // Config files go first so that the command line overrides them.
    sifparts::flags::LoadConfigFiles(sifparts::flags::ConfigFiles(std::getenv("HOME"), std::getenv(kConfigEnv)),
                                     argv[0]);
  } catch (const sifparts::utils::FileException &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
  gflags::ParseCommandLineFlags(&flag_argc, &flag_argv_data, true);
  if (flag_argc > 1) {
    spdlog::error("Unexpected argument: {}", flag_argv_data[1]);
    return 1;
  }

  try {
    sifparts::flags::InitializeLogger();
  } catch (const spdlog::spdlog_ex &e) {
    spdlog::error("Couldn't initialize the logger: {}", e.what());
    return 1;
  }

  try {
    return command->run();
  } catch (const sifparts::utils::BasicException &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}
