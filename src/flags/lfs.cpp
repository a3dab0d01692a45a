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

#include "flags/lfs.hpp"

#include <string>

#include "flags/validation.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(lfs_bin_dir, "", "Directory that receives the git-lfs binary, $HOME/bin by default.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(lfs_release_index_url, std::string(sifparts::lfs::kDefaultReleaseIndexUrl).c_str(),
              "Descriptor of the git-lfs release to install.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(lfs_platform, "linux-amd64", "Platform token the release asset name has to contain.");
DEFINE_validator(lfs_platform, &sifparts::flags::ValidateNotEmpty);
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_uint64(lfs_download_timeout_sec, sifparts::lfs::kDefaultDownloadTimeoutSec,
              "Abort a git-lfs download that connects or receives nothing for this many seconds, 0 waits forever.");

namespace sifparts::flags {

lfs::InstallerConfig InstallerConfigFromFlags(const char *min_git_version) {
  lfs::InstallerConfig config;
  if (min_git_version != nullptr && *min_git_version != '\0') {
    config.min_git_version = min_git_version;
  }
  config.platform_token = FLAGS_lfs_platform;
  config.bin_dir = FLAGS_lfs_bin_dir.empty() ? lfs::DefaultBinDir() : std::filesystem::path(FLAGS_lfs_bin_dir);
  config.release_index_url = FLAGS_lfs_release_index_url;
  config.download_timeout_sec = FLAGS_lfs_download_timeout_sec;
  return config;
}

}  // namespace sifparts::flags
