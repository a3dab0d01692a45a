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
#include <vector>

namespace sifparts::lfs {

// Everything the installer touches outside of its own process goes through
// one of these. Implementations log the reason of a failure themselves.

class VersionControl {
 public:
  virtual ~VersionControl() = default;

  virtual std::string_view Name() const = 0;
  virtual bool IsAvailable() const = 0;
  /// True when `git lfs` is already callable.
  virtual bool IsLfsAvailable() const = 0;
  /// Raw `--version` output, `std::nullopt` if it couldn't be obtained.
  virtual std::optional<std::string> VersionOutput() const = 0;
};

class Downloader {
 public:
  virtual ~Downloader() = default;

  virtual std::string_view Name() const = 0;
  virtual bool IsAvailable() const = 0;
  virtual bool Download(const std::string &url, const std::filesystem::path &destination) = 0;
};

class Archiver {
 public:
  virtual ~Archiver() = default;

  virtual std::string_view Name() const = 0;
  virtual bool IsAvailable() const = 0;
  virtual bool Extract(const std::filesystem::path &archive, const std::filesystem::path &destination) = 0;
};

class ReleaseIndex {
 public:
  virtual ~ReleaseIndex() = default;

  /// Download URLs of the latest release, `std::nullopt` if the index
  /// couldn't be fetched or read.
  virtual std::optional<std::vector<std::string>> AssetUrls() = 0;
};

class ScriptRunner {
 public:
  virtual ~ScriptRunner() = default;

  /// Runs the install script shipped in `install_dir` so that the binaries
  /// end up in `bin_dir`.
  virtual bool Run(const std::filesystem::path &install_dir, const std::filesystem::path &bin_dir) = 0;
};

}  // namespace sifparts::lfs
