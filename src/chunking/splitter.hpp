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
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "chunking/chunk_size.hpp"
#include "chunking/part_name.hpp"

namespace sifparts::chunking {

struct SplitOptions {
  std::filesystem::path input;
  /// Empty means the input base name without `.sif`.
  std::string prefix;
  std::filesystem::path out_dir{"."};
  uint64_t chunk_size{kDefaultChunkSize};
  uint32_t digits{kDefaultDigits};
  uint64_t start{kDefaultStartIndex};
};

/// Everything a strategy needs to write the parts of one input. Built and
/// validated by `Split`, so strategies can trust it.
struct SplitPlan {
  std::filesystem::path input;
  std::string prefix;
  std::filesystem::path parts_dir;
  uint64_t input_size{0};
  uint64_t chunk_size{0};
  uint32_t digits{0};
  uint64_t start{0};
  uint64_t part_count{0};

  std::filesystem::path PartPath(uint64_t index) const;
  std::vector<std::filesystem::path> PartPaths() const;
};

struct SplitResult {
  std::filesystem::path parts_dir;
  std::vector<std::filesystem::path> parts;
};

/// A way of cutting the input into part files.
class Splitter {
 public:
  virtual ~Splitter() = default;

  virtual std::string_view Name() const = 0;
  virtual bool IsAvailable() const = 0;

  /// Writes every part of `plan` into `plan.parts_dir`, which already exists.
  ///
  /// @throw utils::FileException
  virtual void WriteParts(const SplitPlan &plan) = 0;
};

/// Plain file I/O implementation, always available.
class BuiltinSplitter final : public Splitter {
 public:
  std::string_view Name() const override { return "builtin"; }
  bool IsAvailable() const override { return true; }
  void WriteParts(const SplitPlan &plan) override;
};

/// Delegates to GNU `split`. Usable only when the program understands
/// `--numeric-suffixes`.
class SystemSplitter final : public Splitter {
 public:
  explicit SystemSplitter(std::string program = "split");

  std::string_view Name() const override { return "system"; }
  bool IsAvailable() const override;
  void WriteParts(const SplitPlan &plan) override;

  /// Arguments passed to the program for `plan`, program name included.
  std::vector<std::string> Arguments(const SplitPlan &plan) const;

 private:
  std::string program_;
};

enum class SplitterKind : uint8_t { AUTO, SYSTEM, BUILTIN };

/// AUTO picks the system splitter when it is available and the builtin one
/// otherwise.
///
/// @throw MissingDependencyException if SYSTEM is requested but unavailable
std::unique_ptr<Splitter> MakeSplitter(SplitterKind kind);

/// Validates `options` and turns them into a plan. Nothing is created on disk.
///
/// @throw InputNotFoundException
/// @throw InvalidConfigurationException
SplitPlan PlanSplit(const SplitOptions &options);

/// Splits `options.input` into `<out_dir>/<prefix>/<prefix>.<index>.sif`
/// files using `splitter`. An empty input produces no parts. Parts written
/// before a failure stay on disk.
///
/// @throw InputNotFoundException
/// @throw InvalidConfigurationException
/// @throw utils::FileException
SplitResult Split(const SplitOptions &options, Splitter &splitter);

}  // namespace sifparts::chunking
