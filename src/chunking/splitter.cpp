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

#include "chunking/splitter.hpp"

#include <algorithm>
#include <string>

#include <fmt/format.h>

#include "chunking/exceptions.hpp"
#include "utils/file.hpp"
#include "utils/logging.hpp"
#include "utils/process.hpp"
#include "utils/readable_size.hpp"
#include "utils/string.hpp"

namespace sifparts::chunking {

std::filesystem::path SplitPlan::PartPath(uint64_t index) const {
  return parts_dir / PartFileName(prefix, index, digits);
}

std::vector<std::filesystem::path> SplitPlan::PartPaths() const {
  std::vector<std::filesystem::path> paths;
  paths.reserve(part_count);
  for (uint64_t i = 0; i < part_count; ++i) {
    paths.emplace_back(PartPath(start + i));
  }
  return paths;
}

void BuiltinSplitter::WriteParts(const SplitPlan &plan) {
  utils::InputFile input;
  if (!input.Open(plan.input)) {
    throw utils::FileException("Couldn't open {} for reading", plan.input.string());
  }

  auto remaining = plan.input_size;
  auto index = plan.start;
  while (remaining > 0) {
    auto const part_size = std::min(remaining, plan.chunk_size);
    auto const path = plan.PartPath(index);

    utils::OutputFile part;
    part.Open(path);
    utils::CopyBytes(input, part, part_size);
    part.Close();
    spdlog::debug("Wrote {} ({})", path.string(), utils::ReadableSize(part_size));

    remaining -= part_size;
    ++index;
  }
}

SystemSplitter::SystemSplitter(std::string program) : program_(std::move(program)) {}

bool SystemSplitter::IsAvailable() const {
  if (!utils::FindExecutable(program_)) return false;
  auto const help = utils::Exec({program_, "--help"});
  return help && help->Succeeded() && help->output.find("--numeric-suffixes") != std::string::npos;
}

std::vector<std::string> SystemSplitter::Arguments(const SplitPlan &plan) const {
  return {program_,
          "-b",
          std::to_string(plan.chunk_size),
          "-d",
          "-a",
          std::to_string(plan.digits),
          fmt::format("--numeric-suffixes={}", plan.start),
          fmt::format("--additional-suffix={}", kPartExtension),
          "--",
          plan.input.string(),
          (plan.parts_dir / (plan.prefix + ".")).string()};
}

void SystemSplitter::WriteParts(const SplitPlan &plan) {
  auto const result = utils::Exec(Arguments(plan));
  if (!result) {
    throw utils::FileException("Couldn't start {}", program_);
  }
  if (!result->Succeeded()) {
    throw utils::FileException("{} failed with exit code {}: {}", program_, result->exit_code,
                               utils::Trim(result->output));
  }
  for (const auto &path : plan.PartPaths()) {
    if (!utils::IsRegularFile(path)) {
      throw utils::FileException("{} didn't produce the expected part {}", program_, path.string());
    }
  }
}

std::unique_ptr<Splitter> MakeSplitter(SplitterKind kind) {
  switch (kind) {
    case SplitterKind::BUILTIN:
      return std::make_unique<BuiltinSplitter>();
    case SplitterKind::SYSTEM: {
      auto splitter = std::make_unique<SystemSplitter>();
      if (!splitter->IsAvailable()) {
        throw MissingDependencyException("GNU split with --numeric-suffixes support isn't available");
      }
      return splitter;
    }
    case SplitterKind::AUTO: {
      auto splitter = std::make_unique<SystemSplitter>();
      if (splitter->IsAvailable()) return splitter;
      spdlog::info("GNU split isn't available, using the builtin splitter.");
      return std::make_unique<BuiltinSplitter>();
    }
  }
  throw InvalidConfigurationException("Unknown splitter kind");
}

SplitPlan PlanSplit(const SplitOptions &options) {
  if (options.input.empty()) {
    throw InvalidConfigurationException("An input file is required");
  }
  if (!utils::IsRegularFile(options.input)) {
    throw InputNotFoundException("Input file not found: {}", options.input.string());
  }
  if (options.chunk_size < 1) {
    throw InvalidConfigurationException("Chunk size must be at least one byte");
  }
  if (options.digits < 1 || options.digits > kMaxDigits) {
    throw InvalidConfigurationException("Digits must be in range [1, {}], got {}", kMaxDigits, options.digits);
  }

  SplitPlan plan;
  plan.input = options.input;
  plan.prefix = options.prefix.empty() ? DefaultPrefix(options.input) : options.prefix;
  if (!IsValidPrefix(plan.prefix)) {
    throw InvalidConfigurationException("Invalid prefix '{}'", plan.prefix);
  }
  plan.parts_dir = options.out_dir / plan.prefix;
  plan.chunk_size = options.chunk_size;
  plan.digits = options.digits;
  plan.start = options.start;

  std::error_code error_code;
  auto const size = std::filesystem::file_size(options.input, error_code);
  if (error_code) {
    throw utils::FileException("Couldn't get the size of {}: {}", options.input.string(), error_code.message());
  }
  plan.input_size = size;
  plan.part_count = size / plan.chunk_size + (size % plan.chunk_size != 0 ? 1 : 0);

  auto const max_index = MaxIndex(plan.digits);
  if (plan.start > max_index) {
    throw InvalidConfigurationException("Start index {} doesn't fit into {} digits", plan.start, plan.digits);
  }
  if (plan.part_count > 0 && plan.part_count - 1 > max_index - plan.start) {
    throw InvalidConfigurationException("{} parts starting at {} don't fit into {} digits", plan.part_count,
                                        plan.start, plan.digits);
  }
  return plan;
}

SplitResult Split(const SplitOptions &options, Splitter &splitter) {
  auto const plan = PlanSplit(options);
  utils::EnsureDirOrThrow(plan.parts_dir);

  spdlog::info("Splitting {} ({}) into {} part(s) of at most {} under {} using the {} splitter.",
               plan.input.string(), utils::ReadableSize(plan.input_size), plan.part_count,
               utils::ReadableSize(plan.chunk_size), plan.parts_dir.string(),
               splitter.Name());
  splitter.WriteParts(plan);

  return SplitResult{.parts_dir = plan.parts_dir, .parts = plan.PartPaths()};
}

}  // namespace sifparts::chunking
