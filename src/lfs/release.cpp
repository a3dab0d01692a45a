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

#include "lfs/release.hpp"

#include <nlohmann/json.hpp>


namespace sifparts::lfs {

std::vector<std::string> ParseReleaseAssetUrls(std::string_view release_json) {
  nlohmann::json release;
  try {
    release = nlohmann::json::parse(release_json);
  } catch (const nlohmann::json::parse_error &e) {
    throw ReleaseFormatException("Couldn't parse the release descriptor: {}", e.what());
  }
  if (!release.is_object()) {
    throw ReleaseFormatException("The release descriptor isn't a JSON object");
  }

  std::vector<std::string> urls;
  auto const assets = release.find("assets");
  if (assets == release.end() || !assets->is_array()) return urls;
  for (const auto &asset : *assets) {
    if (!asset.is_object()) continue;
    auto const url = asset.find("browser_download_url");
    if (url == asset.end() || !url->is_string()) continue;
    urls.emplace_back(url->get<std::string>());
  }
  return urls;
}

std::string_view UrlFileName(std::string_view url) {
  if (auto const end = url.find_first_of("?#"); end != std::string_view::npos) url = url.substr(0, end);
  if (auto const slash = url.rfind('/'); slash != std::string_view::npos) url = url.substr(slash + 1);
  return url;
}

std::optional<std::string> SelectAsset(const std::vector<std::string> &urls, std::string_view platform_token,
                                       std::string_view archive_suffix) {
  for (const auto &url : urls) {
    auto const file_name = UrlFileName(url);
    if (file_name.find(platform_token) != std::string_view::npos && file_name.ends_with(archive_suffix)) {
      return url;
    }
  }
  return std::nullopt;
}

}  // namespace sifparts::lfs
