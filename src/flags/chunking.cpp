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

#include "flags/chunking.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "chunking/exceptions.hpp"
#include "flags/validation.hpp"
#include "utils/enum.hpp"
#include "utils/logging.hpp"

namespace {

using namespace std::string_view_literals;

constexpr std::array<sifparts::utils::EnumName<sifparts::chunking::SplitterKind>, 3> kSplitters{{
    {"auto"sv, sifparts::chunking::SplitterKind::AUTO},
    {"system"sv, sifparts::chunking::SplitterKind::SYSTEM},
    {"builtin"sv, sifparts::chunking::SplitterKind::BUILTIN},
}};

const std::string kSplitterHelp =
    fmt::format("How parts are written, one of {}. 'auto' uses GNU split when it is usable.",
                sifparts::utils::EnumNames(kSplitters));

bool ValidateChunkSize(const char *flag_name, const std::string &value) {
  try {
    sifparts::chunking::ParseChunkSize(value);
    return true;
  } catch (const sifparts::chunking::InvalidConfigurationException &e) {
    spdlog::error("--{}: {}", flag_name, e.what());
    return false;
  }
}

bool ValidateDigits(const char *flag_name, int32_t value) {
  return sifparts::flags::ValidateInRange<1, static_cast<int32_t>(sifparts::chunking::kMaxDigits)>(flag_name, value);
}

bool ValidateSplitter(const char *flag_name, const std::string &value) {
  return sifparts::flags::ValidateEnumName(flag_name, value, kSplitters);
}

}  // namespace

// Split flags
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(input, "", "File to split.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(prefix, "",
              "Base name shared by all parts. Split defaults to the input file name without a trailing .sif, join "
              "requires it.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(out_dir, ".", "Directory under which the <prefix> parts directory is created.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(chunk_size, "2G", "Size of one part, e.g. 512, 64k, 1.5M or 2G (powers of 1024).");
DEFINE_validator(chunk_size, &ValidateChunkSize);
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_uint64(start, sifparts::chunking::kDefaultStartIndex, "Index of the first part.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(splitter, "auto", kSplitterHelp.c_str());
DEFINE_validator(splitter, &ValidateSplitter);

// Shared by split and join
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_int32(digits, sifparts::chunking::kDefaultDigits, "Width of the zero-padded part index.");
DEFINE_validator(digits, &ValidateDigits);

// Join flags
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(in_dir, ".", "Directory holding the <prefix> parts directory or the parts themselves.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(output, "", "Joined file, <prefix>.sif by default.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(strict_sequence, false, "Refuse to join when part indices have gaps.");

namespace sifparts::flags {

chunking::SplitterKind SplitterKindFromFlags() {
  auto const kind = utils::EnumFromName(FLAGS_splitter, kSplitters);
  SP_ASSERT(kind, "--splitter passed validation but isn't a known splitter");
  return *kind;
}

chunking::SplitOptions SplitOptionsFromFlags() {
  chunking::SplitOptions options;
  options.input = FLAGS_input;
  options.prefix = FLAGS_prefix;
  options.out_dir = FLAGS_out_dir;
  options.chunk_size = chunking::ParseChunkSize(FLAGS_chunk_size);
  options.digits = static_cast<uint32_t>(FLAGS_digits);
  options.start = FLAGS_start;
  return options;
}

chunking::JoinOptions JoinOptionsFromFlags() {
  chunking::JoinOptions options;
  options.prefix = FLAGS_prefix;
  options.in_dir = FLAGS_in_dir;
  options.output = FLAGS_output;
  options.digits = static_cast<uint32_t>(FLAGS_digits);
  options.strict_sequence = FLAGS_strict_sequence;
  return options;
}

}  // namespace sifparts::flags
