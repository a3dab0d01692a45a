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
#include <filesystem>
#include <string>

namespace sifparts::requests {

/// Initialises libcurl. `main` calls it once before the first request.
void Init();

/// GETs `url` into `path`, following redirects. HTTP error statuses fail the
/// download. A `timeout_sec` other than 0 limits both connecting and the
/// longest stretch without received data.
///
/// @return false if anything failed, the reason is logged
bool DownloadFile(const std::string &url, const std::filesystem::path &path, uint64_t timeout_sec);

/// GETs `url` into memory, same rules as `DownloadFile`.
///
/// @throw utils::BasicException if the content couldn't be fetched
std::string FetchText(const std::string &url, uint64_t timeout_sec);

}  // namespace sifparts::requests
