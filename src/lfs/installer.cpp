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

#include "lfs/installer.hpp"

#include <cstdlib>
#include <optional>
#include <vector>

#include "lfs/release.hpp"
#include "lfs/version.hpp"
#include "utils/file.hpp"
#include "utils/logging.hpp"
#include "utils/scratch_dir.hpp"

namespace sifparts::lfs {

namespace fs = std::filesystem;

namespace {

template <typename... Args>
std::unexpected<InstallError> Fail(InstallErrorKind kind, fmt::format_string<Args...> fmt, Args &&...args) {
  return std::unexpected{InstallError{kind, fmt::format(fmt, std::forward<Args>(args)...)}};
}

}  // namespace

fs::path DefaultBinDir() {
  auto const *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') return {};
  return fs::path(home) / "bin";
}

std::string_view InstallStatusToString(InstallStatus status) {
  switch (status) {
    case InstallStatus::INSTALLED:
      return "INSTALLED";
    case InstallStatus::ALREADY_AVAILABLE:
      return "ALREADY_AVAILABLE";
    case InstallStatus::SKIPPED:
      return "SKIPPED";
  }
  return "UNKNOWN";
}

std::string_view InstallErrorKindToString(InstallErrorKind kind) {
  switch (kind) {
    case InstallErrorKind::MISSING_DEPENDENCY:
      return "MISSING_DEPENDENCY";
    case InstallErrorKind::VERSION_PARSE_ERROR:
      return "VERSION_PARSE_ERROR";
    case InstallErrorKind::INVALID_CONFIGURATION:
      return "INVALID_CONFIGURATION";
    case InstallErrorKind::ASSET_NOT_FOUND:
      return "ASSET_NOT_FOUND";
    case InstallErrorKind::MALFORMED_ARCHIVE:
      return "MALFORMED_ARCHIVE";
    case InstallErrorKind::IO_ERROR:
      return "IO_ERROR";
  }
  return "UNKNOWN";
}

LfsInstaller::LfsInstaller(InstallerConfig config, Collaborators collaborators)
    : config_(std::move(config)), collaborators_(collaborators) {}

std::expected<void, InstallError> LfsInstaller::CheckDependencies() const {
  if (!collaborators_.version_control.IsAvailable()) {
    return Fail(InstallErrorKind::MISSING_DEPENDENCY, "{} not found.", collaborators_.version_control.Name());
  }
  if (!collaborators_.downloader.IsAvailable()) {
    return Fail(InstallErrorKind::MISSING_DEPENDENCY, "{} is required to download git-lfs.",
                collaborators_.downloader.Name());
  }
  if (!collaborators_.archiver.IsAvailable()) {
    return Fail(InstallErrorKind::MISSING_DEPENDENCY, "{} is required to extract git-lfs.",
                collaborators_.archiver.Name());
  }
  return {};
}

std::expected<bool, InstallError> LfsInstaller::GitNeedsLocalLfs() const {
  auto const output = collaborators_.version_control.VersionOutput();
  auto const extracted = output ? ExtractGitVersion(*output) : std::nullopt;
  if (!extracted) {
    return Fail(InstallErrorKind::VERSION_PARSE_ERROR, "Unable to determine git version.");
  }
  auto const git_version = ParseVersion(*extracted);
  if (!git_version) {
    return Fail(InstallErrorKind::VERSION_PARSE_ERROR, "Unable to parse git version '{}'.", *extracted);
  }
  auto const threshold = ParseVersion(config_.min_git_version);
  if (!threshold) {
    return Fail(InstallErrorKind::INVALID_CONFIGURATION, "Invalid minimum git version '{}'.", config_.min_git_version);
  }

  if (!VersionLess(*git_version, *threshold)) {
    spdlog::info("git {} is new enough; skipping local git-lfs install.", *extracted);
    spdlog::info("Install git-lfs via your package manager or set SIF_LFS_INSTALL_IF_GIT_LT higher.");
    return false;
  }
  spdlog::debug("git {} is older than {}, installing git-lfs locally.", *extracted, VersionToString(*threshold));
  return true;
}

std::expected<std::string, InstallError> LfsInstaller::FindReleaseAsset() const {
  auto const urls = collaborators_.release_index.AssetUrls();
  if (!urls) {
    return Fail(InstallErrorKind::IO_ERROR, "Unable to query the git-lfs release index.");
  }
  auto asset = SelectAsset(*urls, config_.platform_token, config_.archive_suffix);
  if (!asset) {
    return Fail(InstallErrorKind::ASSET_NOT_FOUND, "Unable to find {} git-lfs release URL.", config_.platform_token);
  }
  return std::move(*asset);
}

std::expected<fs::path, InstallError> LfsInstaller::FindInstallDir(const fs::path &extracted) const {
  std::vector<fs::path> candidates;
  std::error_code error_code;
  for (auto it = fs::directory_iterator(extracted, error_code); !error_code && it != fs::directory_iterator();
       it.increment(error_code)) {
    if (!it->path().filename().string().starts_with(config_.archive_dir_prefix)) continue;
    if (!utils::DirExists(it->path())) continue;
    candidates.push_back(it->path());
  }
  if (error_code) {
    return Fail(InstallErrorKind::IO_ERROR, "Couldn't list {}: {}", extracted.string(), error_code.message());
  }
  if (candidates.size() != 1) {
    return Fail(InstallErrorKind::MALFORMED_ARCHIVE,
                "git-lfs archive did not contain expected directory, found {} directories starting with '{}'.",
                candidates.size(), config_.archive_dir_prefix);
  }
  return candidates.front();
}

std::expected<void, InstallError> LfsInstaller::DownloadAndInstall(const std::string &asset_url) const {
  if (config_.bin_dir.empty()) {
    return Fail(InstallErrorKind::INVALID_CONFIGURATION, "No bin directory to install git-lfs into.");
  }
  if (!utils::EnsureDir(config_.bin_dir)) {
    return Fail(InstallErrorKind::IO_ERROR, "Couldn't create {}.", config_.bin_dir.string());
  }

  std::optional<utils::ScratchDir> scratch_dir;
  try {
    scratch_dir.emplace("sifparts-lfs", config_.temp_root);
  } catch (const utils::FileException &e) {
    return Fail(InstallErrorKind::IO_ERROR, "{}", e.what());
  }
  auto const &scratch = scratch_dir->path();

  auto const archive = scratch / ("git-lfs" + config_.archive_suffix);
  if (!collaborators_.downloader.Download(asset_url, archive)) {
    return Fail(InstallErrorKind::IO_ERROR, "Couldn't download {}.", asset_url);
  }
  if (!collaborators_.archiver.Extract(archive, scratch)) {
    return Fail(InstallErrorKind::IO_ERROR, "Couldn't extract {}.", archive.string());
  }

  auto const install_dir = FindInstallDir(scratch);
  if (!install_dir) return std::unexpected{install_dir.error()};

  if (!collaborators_.script_runner.Run(*install_dir, config_.bin_dir)) {
    return Fail(InstallErrorKind::IO_ERROR, "The git-lfs install script failed in {}.", install_dir->string());
  }
  return {};
}

std::expected<InstallStatus, InstallError> LfsInstaller::Run() {
  if (collaborators_.version_control.IsLfsAvailable()) {
    spdlog::info("git-lfs already available.");
    return InstallStatus::ALREADY_AVAILABLE;
  }

  if (auto const dependencies = CheckDependencies(); !dependencies) {
    return std::unexpected{dependencies.error()};
  }

  auto const needs_install = GitNeedsLocalLfs();
  if (!needs_install) return std::unexpected{needs_install.error()};
  if (!*needs_install) return InstallStatus::SKIPPED;

  auto const asset_url = FindReleaseAsset();
  if (!asset_url) return std::unexpected{asset_url.error()};

  if (auto const installed = DownloadAndInstall(*asset_url); !installed) {
    return std::unexpected{installed.error()};
  }

  spdlog::info("git-lfs installed to {}. Ensure {} is on PATH.", config_.bin_dir.string(), config_.bin_dir.string());
  return InstallStatus::INSTALLED;
}

}  // namespace sifparts::lfs
