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

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>

#include "utils/exceptions.hpp"

namespace sifparts::utils {

/// Reading, writing or creating a file or directory failed.
class FileException final : public BasicException {
 public:
  using BasicException::BasicException;
};

// Directory helpers. They never throw, a failure shows in the result.
bool EnsureDir(const std::filesystem::path &dir) noexcept;
bool DirExists(const std::filesystem::path &dir) noexcept;
bool IsRegularFile(const std::filesystem::path &path) noexcept;
/// Removes `dir` with everything in it, false if `dir` isn't a directory.
bool DeleteDir(const std::filesystem::path &dir) noexcept;

/// @throw FileException if `dir` doesn't exist afterwards
void EnsureDirOrThrow(const std::filesystem::path &dir);

/// Bytes moved per read and write in `CopyBytes`.
inline constexpr size_t kCopyBlockSize = 1U << 20U;

/// Read-only POSIX file descriptor that is read from start to end. Reads go
/// straight to the kernel into the caller's buffer.
class InputFile {
 public:
  InputFile() = default;
  ~InputFile();

  InputFile(const InputFile &) = delete;
  InputFile &operator=(const InputFile &) = delete;
  InputFile(InputFile &&) = delete;
  InputFile &operator=(InputFile &&) = delete;

  /// False if the file doesn't exist or can't be read.
  bool Open(const std::filesystem::path &path);
  bool IsOpen() const { return fd_ != -1; }
  const std::filesystem::path &path() const { return path_; }
  /// Size at the time it was opened.
  uint64_t size() const { return size_; }
  uint64_t offset() const { return offset_; }

  /// Reads up to `size` bytes, fewer only at the end of the file.
  ///
  /// @return number of bytes read, 0 at the end of the file
  /// @throw FileException on a read error
  size_t Read(uint8_t *data, size_t size);

  /// Errors are only logged, nothing was written.
  void Close() noexcept;

 private:
  int fd_{-1};
  std::filesystem::path path_;
  uint64_t size_{0};
  uint64_t offset_{0};
};

/// Write-only POSIX file descriptor. Opening creates the file with mode 0666
/// masked by the umask, or truncates an existing one.
class OutputFile {
 public:
  OutputFile() = default;
  /// Closes the file. Errors are logged, call `Close` to see them.
  ~OutputFile();

  OutputFile(const OutputFile &) = delete;
  OutputFile &operator=(const OutputFile &) = delete;
  OutputFile(OutputFile &&) = delete;
  OutputFile &operator=(OutputFile &&) = delete;

  /// @throw FileException
  void Open(const std::filesystem::path &path);
  bool IsOpen() const { return fd_ != -1; }
  const std::filesystem::path &path() const { return path_; }

  /// Writes everything or throws.
  ///
  /// @throw FileException
  void Write(const uint8_t *data, size_t size);
  void Write(std::string_view data);

  /// Bytes written since `Open`.
  uint64_t written() const { return written_; }

  /// @throw FileException
  void Close();

 private:
  int fd_{-1};
  std::filesystem::path path_;
  uint64_t written_{0};
};

/// Copies the next `size` bytes of `input` to `output`.
///
/// @throw FileException if `input` ends early or either side fails
void CopyBytes(InputFile &input, OutputFile &output, uint64_t size);

}  // namespace sifparts::utils
