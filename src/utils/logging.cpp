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

#include "utils/logging.hpp"

#include <exception>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace sifparts::logging {

void AssertFailed(const std::source_location &location, const char *expression, const std::string &message) {
  if (message.empty()) {
    spdlog::critical("{}:{}: assertion '{}' failed", location.file_name(), location.line(), expression);
  } else {
    spdlog::critical("{}:{}: assertion '{}' failed: {}", location.file_name(), location.line(), expression, message);
  }
  spdlog::default_logger()->flush();
  std::terminate();
}

void RedirectToStderr() { spdlog::set_default_logger(spdlog::stderr_color_mt("sifparts_stderr")); }

}  // namespace sifparts::logging
