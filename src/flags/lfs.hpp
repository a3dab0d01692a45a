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

#include <gflags/gflags.h>

#include "lfs/installer.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_string(lfs_bin_dir);
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_string(lfs_release_index_url);
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_string(lfs_platform);
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_uint64(lfs_download_timeout_sec);

namespace sifparts::flags {

/// Name of the environment variable holding the git version below which
/// git-lfs gets installed.
inline constexpr const char *kMinGitVersionEnv = "SIF_LFS_INSTALL_IF_GIT_LT";

/// Installer configuration from the `--lfs_*` flags. `min_git_version` is
/// the value of `kMinGitVersionEnv`; null or empty keeps the default.
lfs::InstallerConfig InstallerConfigFromFlags(const char *min_git_version);

}  // namespace sifparts::flags
