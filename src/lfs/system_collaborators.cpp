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

#include "lfs/system_collaborators.hpp"

#include "lfs/release.hpp"
#include "requests/requests.hpp"
#include "utils/file.hpp"
#include "utils/logging.hpp"
#include "utils/process.hpp"
#include "utils/string.hpp"

namespace sifparts::lfs {

namespace {

constexpr std::string_view kInstallScript = "install.sh";
constexpr std::string_view kLfsBinary = "git-lfs";

// Runs the command and logs its output when it fails.
bool RunLogged(const std::vector<std::string> &args, const utils::ExecOptions &options = {}) {
  auto const result = utils::Exec(args, options);
  if (!result) {
    spdlog::error("Couldn't start '{}'.", args.front());
    return false;
  }
  if (!result->Succeeded()) {
    spdlog::error("'{}' failed with exit code {}: {}", utils::Join(args, " "), result->exit_code,
                  utils::Trim(result->output));
    return false;
  }
  spdlog::debug("'{}' printed: {}", args.front(), utils::Trim(result->output));
  return true;
}

}  // namespace

GitCli::GitCli(std::string program) : program_(std::move(program)) {}

bool GitCli::IsAvailable() const { return utils::FindExecutable(program_).has_value(); }

bool GitCli::IsLfsAvailable() const {
  if (!IsAvailable()) return false;
  auto const result = utils::Exec({program_, "lfs", "version"});
  return result && result->Succeeded();
}

std::optional<std::string> GitCli::VersionOutput() const {
  auto const result = utils::Exec({program_, "--version"});
  if (!result || !result->Succeeded()) {
    spdlog::error("'{} --version' didn't succeed.", program_);
    return std::nullopt;
  }
  return result->output;
}

CurlDownloader::CurlDownloader(uint64_t timeout_sec) : timeout_sec_(timeout_sec) {}

bool CurlDownloader::Download(const std::string &url, const std::filesystem::path &destination) {
  spdlog::info("Downloading {}", url);
  return requests::DownloadFile(url, destination, timeout_sec_);
}

TarArchiver::TarArchiver(std::string program) : program_(std::move(program)) {}

bool TarArchiver::IsAvailable() const { return utils::FindExecutable(program_).has_value(); }

bool TarArchiver::Extract(const std::filesystem::path &archive, const std::filesystem::path &destination) {
  return RunLogged({program_, "-xzf", archive.string(), "-C", destination.string()});
}

GithubReleaseIndex::GithubReleaseIndex(std::string url, uint64_t timeout_sec)
    : url_(std::move(url)), timeout_sec_(timeout_sec) {}

std::optional<std::vector<std::string>> GithubReleaseIndex::AssetUrls() {
  try {
    return ParseReleaseAssetUrls(requests::FetchText(url_, timeout_sec_));
  } catch (const utils::BasicException &e) {
    spdlog::error("Couldn't read the release index {}: {}", url_, e.what());
    return std::nullopt;
  }
}

InstallScriptRunner::InstallScriptRunner(std::filesystem::path local_bin_dir)
    : local_bin_dir_(std::move(local_bin_dir)) {}

bool InstallScriptRunner::Run(const std::filesystem::path &install_dir, const std::filesystem::path &bin_dir) {
  if (!utils::IsRegularFile(install_dir / kInstallScript)) {
    spdlog::error("{} doesn't contain {}.", install_dir.string(), kInstallScript);
    return false;
  }
  utils::ExecOptions options;
  options.working_dir = install_dir;
  options.env.emplace_back("PREFIX", bin_dir.parent_path().string());
  std::vector<std::string> args{fmt::format("./{}", kInstallScript)};
  if (!local_bin_dir_.empty() && bin_dir == local_bin_dir_) args.emplace_back("--local");
  if (!RunLogged(args, options)) return false;

  if (!utils::IsRegularFile(bin_dir / kLfsBinary)) {
    spdlog::warn("{} finished without creating {}, see its output for where git-lfs went.", kInstallScript,
                 (bin_dir / kLfsBinary).string());
  }
  return true;
}

}  // namespace sifparts::lfs
