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

#include "utils/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

#include "utils/logging.hpp"

namespace sifparts::utils {

namespace {

/// Repeats a system call interrupted by a signal.
template <typename Call>
auto RetryOnEintr(Call &&call) {
  while (true) {
    auto const result = call();
    if (result != -1 || errno != EINTR) return result;
  }
}

/// Closes `fd` and resets it to -1, true on success.
bool CloseFd(int &fd) {
  // A close interrupted by a signal has still released the descriptor on
  // Linux, retrying could close a descriptor opened in the meantime.
  auto const result = close(fd);
  fd = -1;
  return result == 0 || errno == EINTR;
}

}  // namespace

bool EnsureDir(const std::filesystem::path &dir) noexcept {
  std::error_code error;
  std::filesystem::create_directories(dir, error);
  return std::filesystem::is_directory(dir, error);
}

bool DirExists(const std::filesystem::path &dir) noexcept {
  std::error_code error;
  return std::filesystem::is_directory(dir, error);
}

bool IsRegularFile(const std::filesystem::path &path) noexcept {
  std::error_code error;
  return std::filesystem::is_regular_file(path, error);
}

bool DeleteDir(const std::filesystem::path &dir) noexcept {
  std::error_code error;
  if (!std::filesystem::is_directory(dir, error)) return false;
  return std::filesystem::remove_all(dir, error) != static_cast<std::uintmax_t>(-1) && !error;
}

void EnsureDirOrThrow(const std::filesystem::path &dir) {
  if (!EnsureDir(dir)) throw FileException("Couldn't create directory {}", dir.string());
}

InputFile::~InputFile() { Close(); }

bool InputFile::Open(const std::filesystem::path &path) {
  SP_ASSERT(!IsOpen(), "{} is still open", path_.string());
  fd_ = RetryOnEintr([&path] { return open(path.c_str(), O_RDONLY | O_CLOEXEC); });
  if (fd_ == -1) return false;

  struct stat info {};
  if (fstat(fd_, &info) != 0 || !S_ISREG(info.st_mode)) {
    CloseFd(fd_);
    return false;
  }
  path_ = path;
  size_ = static_cast<uint64_t>(info.st_size);
  offset_ = 0;
  return true;
}

size_t InputFile::Read(uint8_t *data, size_t size) {
  SP_ASSERT(IsOpen(), "Reading from a file that isn't open");
  auto const got = RetryOnEintr([&] { return read(fd_, data, size); });
  if (got == -1) {
    throw FileException("Couldn't read {} at offset {}: {}", path_.string(), offset_, std::strerror(errno));
  }
  offset_ += static_cast<uint64_t>(got);
  return static_cast<size_t>(got);
}

void InputFile::Close() noexcept {
  if (!IsOpen()) return;
  if (!CloseFd(fd_)) spdlog::warn("Couldn't close {}: {}", path_.string(), std::strerror(errno));
  path_.clear();
}

OutputFile::~OutputFile() {
  if (!IsOpen()) return;
  if (!CloseFd(fd_)) spdlog::error("Couldn't close {}: {}", path_.string(), std::strerror(errno));
}

void OutputFile::Open(const std::filesystem::path &path) {
  SP_ASSERT(!IsOpen(), "{} is still open", path_.string());
  fd_ = RetryOnEintr([&path] { return open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666); });
  if (fd_ == -1) throw FileException("Couldn't open {} for writing: {}", path.string(), std::strerror(errno));
  path_ = path;
  written_ = 0;
}

void OutputFile::Write(const uint8_t *data, size_t size) {
  SP_ASSERT(IsOpen(), "Writing to a file that isn't open");
  while (size > 0) {
    auto const done = RetryOnEintr([&] { return write(fd_, data, size); });
    if (done <= 0) {
      throw FileException("Couldn't write {} at offset {}: {}", path_.string(), written_,
                          done == 0 ? "nothing was written" : std::strerror(errno));
    }
    data += done;
    size -= static_cast<size_t>(done);
    written_ += static_cast<uint64_t>(done);
  }
}

void OutputFile::Write(std::string_view data) { Write(reinterpret_cast<const uint8_t *>(data.data()), data.size()); }

void OutputFile::Close() {
  if (!IsOpen()) return;
  auto const path = std::move(path_);
  path_.clear();
  if (!CloseFd(fd_)) throw FileException("Couldn't close {}: {}", path.string(), std::strerror(errno));
}

void CopyBytes(InputFile &input, OutputFile &output, uint64_t size) {
  std::vector<uint8_t> block(static_cast<size_t>(std::min<uint64_t>(size, kCopyBlockSize)));
  while (size > 0) {
    auto const wanted = static_cast<size_t>(std::min<uint64_t>(size, block.size()));
    auto const got = input.Read(block.data(), wanted);
    if (got == 0) {
      throw FileException("{} ended at offset {} while {} more bytes were expected", input.path().string(),
                          input.offset(), size);
    }
    output.Write(block.data(), got);
    size -= got;
  }
}

}  // namespace sifparts::utils
