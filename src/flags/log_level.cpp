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

#include "flags/log_level.hpp"

#include <array>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "flags/validation.hpp"
#include "utils/enum.hpp"
#include "utils/logging.hpp"

namespace {

using namespace std::string_view_literals;

constexpr std::array<sifparts::utils::EnumName<spdlog::level::level_enum>, 6> kLogLevels{{
    {"TRACE"sv, spdlog::level::trace},
    {"DEBUG"sv, spdlog::level::debug},
    {"INFO"sv, spdlog::level::info},
    {"WARNING"sv, spdlog::level::warn},
    {"ERROR"sv, spdlog::level::err},
    {"CRITICAL"sv, spdlog::level::critical},
}};

const std::string kLogLevelHelp =
    fmt::format("Lowest level that gets logged, one of {}.", sifparts::utils::EnumNames(kLogLevels));

bool ValidateLogLevel(const char *flag_name, const std::string &value) {
  return sifparts::flags::ValidateEnumName(flag_name, value, kLogLevels);
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(log_level, "INFO", kLogLevelHelp.c_str());
DEFINE_validator(log_level, &ValidateLogLevel);

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(log_file, "", "Also append the log to this file.");

namespace sifparts::flags {

std::optional<spdlog::level::level_enum> LogLevelFromName(std::string_view name) {
  return utils::EnumFromName(name, kLogLevels);
}

void InitializeLogger() {
  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!FLAGS_log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(FLAGS_log_file));
  }

  auto const level = LogLevelFromName(FLAGS_log_level);
  SP_ASSERT(level, "--log_level passed validation but isn't a known level");

  auto logger = std::make_shared<spdlog::logger>("sifparts", sinks.begin(), sinks.end());
  logger->set_level(*level);
  logger->set_pattern("[%^%l%$] %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

}  // namespace sifparts::flags
