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
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "lfs/collaborators.hpp"

namespace sifparts::lfs {

inline constexpr std::string_view kDefaultMinGitVersion = "2.13.0";
inline constexpr std::string_view kDefaultReleaseIndexUrl =
    "https://api.github.com/repos/git-lfs/git-lfs/releases/latest";
/// A download that receives nothing for this long is aborted.
inline constexpr uint64_t kDefaultDownloadTimeoutSec = 60;

struct InstallerConfig {
  /// git older than this gets a local git-lfs.
  std::string min_git_version{kDefaultMinGitVersion};
  std::string platform_token{"linux-amd64"};
  std::string archive_suffix{".tar.gz"};
  /// The archive has to hold exactly one top level directory with this prefix.
  std::string archive_dir_prefix{"git-lfs-"};
  std::filesystem::path bin_dir;
  std::string release_index_url{kDefaultReleaseIndexUrl};
  uint64_t download_timeout_sec{kDefaultDownloadTimeoutSec};
  /// Where the scratch directory is created, empty for the system default.
  std::filesystem::path temp_root;
};

/// `$HOME/bin`, empty if `HOME` isn't set.
std::filesystem::path DefaultBinDir();

enum class InstallStatus : uint8_t { INSTALLED, ALREADY_AVAILABLE, SKIPPED };

enum class InstallErrorKind : uint8_t {
  MISSING_DEPENDENCY,
  VERSION_PARSE_ERROR,
  INVALID_CONFIGURATION,
  ASSET_NOT_FOUND,
  MALFORMED_ARCHIVE,
  IO_ERROR,
};

struct InstallError {
  InstallErrorKind kind;
  std::string message;
};

std::string_view InstallStatusToString(InstallStatus status);
std::string_view InstallErrorKindToString(InstallErrorKind kind);

struct Collaborators {
  VersionControl &version_control;
  Downloader &downloader;
  Archiver &archiver;
  ReleaseIndex &release_index;
  ScriptRunner &script_runner;
};

/// Installs git-lfs into the user's bin directory when git is too old to
/// expect a packaged one. Runs each step once, in order, and stops at the
/// first failure. The scratch directory is removed on every path out.
class LfsInstaller {
 public:
  LfsInstaller(InstallerConfig config, Collaborators collaborators);

  std::expected<InstallStatus, InstallError> Run();

 private:
  std::expected<void, InstallError> CheckDependencies() const;
  std::expected<bool, InstallError> GitNeedsLocalLfs() const;
  std::expected<std::string, InstallError> FindReleaseAsset() const;
  std::expected<std::filesystem::path, InstallError> FindInstallDir(const std::filesystem::path &extracted) const;
  std::expected<void, InstallError> DownloadAndInstall(const std::string &asset_url) const;

  InstallerConfig config_;
  Collaborators collaborators_;
};

}  // namespace sifparts::lfs
