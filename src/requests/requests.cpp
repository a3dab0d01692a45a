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

#include "requests/requests.hpp"

#include <cstdio>
#include <memory>

#include <curl/curl.h>
#include <fmt/format.h>
#include <gflags/gflags.h>
#include <spdlog/spdlog.h>
#include <ctre.hpp>

#include "utils/exceptions.hpp"

namespace sifparts::requests {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Only closes on early returns, the regular path closes explicitly to see errors.
struct FileCloser {
  void operator()(FILE *file) const {
    if (std::fclose(file) != 0) spdlog::warn("Couldn't close a partial download");
  }
};
using FileHandle = std::unique_ptr<FILE, FileCloser>;

constexpr long kMaxRedirects = 10;
constexpr int kProgressStepPercent = 10;

bool IsSupportedUrl(const std::string &url) { return static_cast<bool>(ctre::starts_with<"(https?|file)://">(url)); }

struct Progress {
  std::string url;
  int next_percent{kProgressStepPercent};
};

int LogProgress(void *clientp, curl_off_t total, curl_off_t now, curl_off_t /*upload_total*/,
                curl_off_t /*upload_now*/) {
  auto *progress = static_cast<Progress *>(clientp);
  if (total <= 0) return 0;
  auto const percent = static_cast<int>(now * 100 / total);
  if (percent >= progress->next_percent) {
    spdlog::debug("{}: {}% of {} bytes", progress->url, percent, total);
    progress->next_percent = percent - percent % kProgressStepPercent + kProgressStepPercent;
  }
  return 0;
}

size_t AppendToString(char *data, size_t size, size_t count, void *userdata) {
  static_cast<std::string *>(userdata)->append(data, size * count);
  return size * count;
}

/// A handle with everything but the destination set up, null on failure.
CurlHandle OpenRequest(const std::string &url, uint64_t timeout_sec, const std::string &user_agent) {
  if (!IsSupportedUrl(url)) {
    spdlog::error("Unsupported URL {}, expected http, https or file", url);
    return {nullptr, &curl_easy_cleanup};
  }
  CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
  if (!curl) {
    spdlog::error("Couldn't initialise a libcurl handle");
    return curl;
  }
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, kMaxRedirects);
  curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  if (timeout_sec > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_sec));
    // Less than one byte per second for timeout_sec seconds aborts the transfer.
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeout_sec));
  }
  return curl;
}

std::string UserAgent() { return fmt::format("sifparts/{}", gflags::VersionString()); }

}  // namespace

void Init() { curl_global_init(CURL_GLOBAL_ALL); }

bool DownloadFile(const std::string &url, const std::filesystem::path &path, uint64_t timeout_sec) {
  auto const user_agent = UserAgent();
  auto curl = OpenRequest(url, timeout_sec, user_agent);
  if (!curl) return false;

  FileHandle file{std::fopen(path.c_str(), "wb")};
  if (!file) {
    spdlog::error("Couldn't open {} for writing", path.string());
    return false;
  }

  Progress progress{.url = url};
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, file.get());
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &progress);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &LogProgress);

  auto const result = curl_easy_perform(curl.get());
  if (std::fclose(file.release()) != 0) {
    spdlog::error("Couldn't finish writing {}", path.string());
    return false;
  }
  if (result != CURLE_OK) {
    spdlog::error("Downloading {} failed: {}", url, curl_easy_strerror(result));
    return false;
  }
  return true;
}

std::string FetchText(const std::string &url, uint64_t timeout_sec) {
  auto const user_agent = UserAgent();
  auto curl = OpenRequest(url, timeout_sec, user_agent);
  if (!curl) throw utils::BasicException("Couldn't request {}", url);

  std::string body;
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &AppendToString);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  if (auto const result = curl_easy_perform(curl.get()); result != CURLE_OK) {
    throw utils::BasicException("Fetching {} failed: {}", url, curl_easy_strerror(result));
  }
  return body;
}

}  // namespace sifparts::requests
