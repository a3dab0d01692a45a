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

#include "utils/exceptions.hpp"

namespace sifparts::chunking {

/// The input file of a split or the input directory of a join doesn't exist.
class InputNotFoundException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
};

/// Bad chunk size, digit width, start index, prefix or part sequence.
class InvalidConfigurationException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
};

/// An explicitly requested external tool isn't usable.
class MissingDependencyException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
};

/// The searched directory holds no part file of the requested prefix.
class NoPartsFoundException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
};

}  // namespace sifparts::chunking
