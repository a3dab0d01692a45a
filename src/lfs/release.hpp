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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "utils/exceptions.hpp"

namespace sifparts::lfs {

class ReleaseFormatException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
};

/// Download URLs of the release assets, in the order the descriptor lists
/// them. Assets without a `browser_download_url` string are skipped.
///
/// @throw ReleaseFormatException if the text isn't a JSON object
std::vector<std::string> ParseReleaseAssetUrls(std::string_view release_json);

/// Last path segment of the URL with any query or fragment removed.
std::string_view UrlFileName(std::string_view url);

/// First URL whose file name contains `platform_token` and ends with
/// `archive_suffix`.
std::optional<std::string> SelectAsset(const std::vector<std::string> &urls, std::string_view platform_token,
                                       std::string_view archive_suffix);

}  // namespace sifparts::lfs
