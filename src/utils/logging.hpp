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

#include <source_location>
#include <string>
#include <utility>

#include <boost/preprocessor/stringize.hpp>
#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

namespace sifparts::logging {

/// Logs the broken invariant at critical level and terminates the process.
[[noreturn]] void AssertFailed(const std::source_location &location, const char *expression,
                               const std::string &message);

inline std::string AssertMessage() { return {}; }

template <class... Args>
std::string AssertMessage(fmt::format_string<Args...> format, Args &&...args) {
  return fmt::format(format, std::forward<Args>(args)...);
}

/// Installs a plain stderr logger. Used until the `--log_*` flags are parsed.
void RedirectToStderr();

}  // namespace sifparts::logging

/// Guards internal invariants only. User input errors are reported with
/// exceptions, never through an assertion.
#define SP_ASSERT(expr, ...)                                                                        \
  do {                                                                                              \
    if (!(expr)) [[unlikely]] {                                                                     \
      ::sifparts::logging::AssertFailed(std::source_location::current(), BOOST_PP_STRINGIZE(expr), \
                                        ::sifparts::logging::AssertMessage(__VA_ARGS__));          \
    }                                                                                               \
  } while (false)

#ifdef NDEBUG
#define DSP_ASSERT(expr, ...) \
  do {                        \
  } while (false)
#else
#define DSP_ASSERT(expr, ...) SP_ASSERT(expr, __VA_ARGS__)
#endif
