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
#include <string>

#include "lfs/collaborators.hpp"
#include "lfs/installer.hpp"

namespace sifparts::lfs {

/// `git` found on `PATH`.
class GitCli final : public VersionControl {
 public:
  explicit GitCli(std::string program = "git");

  std::string_view Name() const override { return program_; }
  bool IsAvailable() const override;
  bool IsLfsAvailable() const override;
  std::optional<std::string> VersionOutput() const override;

 private:
  std::string program_;
};

/// Downloads through libcurl, which is linked in and therefore always
/// available.
class CurlDownloader final : public Downloader {
 public:
  /// `timeout_sec` limits connecting and stalls, 0 disables the limit.
  explicit CurlDownloader(uint64_t timeout_sec = kDefaultDownloadTimeoutSec);

  std::string_view Name() const override { return "libcurl"; }
  bool IsAvailable() const override { return true; }
  bool Download(const std::string &url, const std::filesystem::path &destination) override;

 private:
  uint64_t timeout_sec_;
};

/// Extracts gzip compressed tarballs with `tar`.
class TarArchiver final : public Archiver {
 public:
  explicit TarArchiver(std::string program = "tar");

  std::string_view Name() const override { return program_; }
  bool IsAvailable() const override;
  bool Extract(const std::filesystem::path &archive, const std::filesystem::path &destination) override;

 private:
  std::string program_;
};

/// Reads a GitHub "latest release" descriptor.
class GithubReleaseIndex final : public ReleaseIndex {
 public:
  explicit GithubReleaseIndex(std::string url, uint64_t timeout_sec = kDefaultDownloadTimeoutSec);

  std::optional<std::vector<std::string>> AssetUrls() override;

 private:
  std::string url_;
  uint64_t timeout_sec_;
};

/// Runs the bundled `./install.sh` with `PREFIX` set to the parent of the bin
/// directory. `--local` is added only when installing into `local_bin_dir`,
/// the script may choose its own location under `$HOME` for it.
class InstallScriptRunner final : public ScriptRunner {
 public:
  explicit InstallScriptRunner(std::filesystem::path local_bin_dir = DefaultBinDir());

  bool Run(const std::filesystem::path &install_dir, const std::filesystem::path &bin_dir) override;

 private:
  std::filesystem::path local_bin_dir_;
};

}  // namespace sifparts::lfs
