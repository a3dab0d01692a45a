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

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace sifparts::utils {

/// Root of every exception sifparts throws on purpose. `main` reports these
/// with the logger and exits with status 1, anything else is a bug.
class BasicException : public std::exception {
 public:
  explicit BasicException(std::string message) noexcept : message_(std::move(message)) {}

  template <class... Args>
  explicit BasicException(fmt::format_string<Args...> format, Args &&...args)
      : message_(fmt::format(format, std::forward<Args>(args)...)) {}

  const char *what() const noexcept override { return message_.c_str(); }

 private:
  std::string message_;
};

/// Text that should hold a number or a version doesn't.
class ParseException final : public BasicException {
 public:
  explicit ParseException(std::string_view text) : BasicException("Couldn't parse '{}'", text) {}
};

}  // namespace sifparts::utils
