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

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "utils/file.hpp"

namespace sifparts::utils {

/// Directory with a unique name, removed together with its contents when the
/// object goes out of scope.
class ScratchDir {
 public:
  /// Creates `<base>/<name_prefix>.XXXXXX`. An empty `base` means the system
  /// temporary directory.
  ///
  /// @throw FileException if the directory couldn't be created
  explicit ScratchDir(std::string_view name_prefix, std::filesystem::path base = {}) {
    if (base.empty()) {
      std::error_code error;
      base = std::filesystem::temp_directory_path(error);
      if (error) throw FileException("No temporary directory available: {}", error.message());
    }
    auto name_template = (base / fmt::format("{}.XXXXXX", name_prefix)).string();
    if (mkdtemp(name_template.data()) == nullptr) {
      throw FileException("Couldn't create a scratch directory in {}: {}", base.string(), std::strerror(errno));
    }
    path_ = std::move(name_template);
  }

  ~ScratchDir() {
    if (!DeleteDir(path_)) spdlog::warn("Couldn't remove {}", path_.string());
  }

  ScratchDir(const ScratchDir &) = delete;
  ScratchDir &operator=(const ScratchDir &) = delete;
  ScratchDir(ScratchDir &&) = delete;
  ScratchDir &operator=(ScratchDir &&) = delete;

  const std::filesystem::path &path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace sifparts::utils
