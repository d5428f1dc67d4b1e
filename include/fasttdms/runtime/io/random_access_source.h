// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_RUNTIME_IO_RANDOM_ACCESS_SOURCE_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_RUNTIME_IO_RANDOM_ACCESS_SOURCE_H_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace fs = std::filesystem;

namespace fasttdms {
namespace runtime {
namespace io {

/// @brief Read-only byte source with positioned reads
///
/// Implementations return fewer bytes than requested when the read crosses
/// the end of the source; that is not an error. Errors are reserved for
/// failures of the underlying medium.
class RandomAccessSource {
 public:
  virtual ~RandomAccessSource() = default;

  /// @brief Read up to `length` bytes starting at `offset`
  /// @return Bytes read (shorter at end of source) or I/O error
  virtual absl::StatusOr<std::vector<uint8_t>> ReadAt(uint64_t offset,
                                                      uint64_t length) const = 0;

  /// @brief Total length in bytes
  virtual absl::StatusOr<uint64_t> GetLength() const = 0;

  /// @brief Whether ReadAt may be called from several threads at once
  [[nodiscard]] virtual bool SupportsConcurrentReads() const { return false; }
};

/// @brief Byte source over an owned in-memory buffer
class MemorySource final : public RandomAccessSource {
 public:
  explicit MemorySource(std::vector<uint8_t> bytes)
      : bytes_(std::move(bytes)) {}

  absl::StatusOr<std::vector<uint8_t>> ReadAt(uint64_t offset,
                                              uint64_t length) const override;

  absl::StatusOr<uint64_t> GetLength() const override { return bytes_.size(); }

  [[nodiscard]] bool SupportsConcurrentReads() const override { return true; }

  /// @brief Drop bytes from the end (simulates a file shrinking under us)
  void Truncate(uint64_t new_length) {
    if (new_length < bytes_.size()) {
      bytes_.resize(new_length);
    }
  }

 private:
  std::vector<uint8_t> bytes_;
};

/// @brief Byte source over a file, using positioned reads
///
/// Positioned reads do not share a file cursor, so one FileSource may be
/// read from several threads at once.
///
/// Example usage:
/// ```cpp
/// DECLARE_ASSIGN_OR_RETURN(std::unique_ptr<FileSource>, source,
///                          FileSource::Open(path));
/// DECLARE_ASSIGN_OR_RETURN(std::vector<uint8_t>, bytes,
///                          source->ReadAt(0, 28));
/// ```
class FileSource final : public RandomAccessSource {
 public:
  /// @brief Open a file for reading
  /// @retval absl::NotFoundError if the file cannot be opened
  static absl::StatusOr<std::unique_ptr<FileSource>> Open(
      const fs::path& path);

  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  absl::StatusOr<std::vector<uint8_t>> ReadAt(uint64_t offset,
                                              uint64_t length) const override;

  absl::StatusOr<uint64_t> GetLength() const override;

  [[nodiscard]] bool SupportsConcurrentReads() const override { return true; }

  [[nodiscard]] const fs::path& GetPath() const { return path_; }

 private:
  FileSource(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}

  int fd_;
  fs::path path_;
};

}  // namespace io
}  // namespace runtime

using runtime::io::FileSource;
using runtime::io::MemorySource;
using runtime::io::RandomAccessSource;

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_RUNTIME_IO_RANDOM_ACCESS_SOURCE_H_
