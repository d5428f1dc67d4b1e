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

#include "fasttdms/runtime/io/random_access_source.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "fasttdms/status/status_macros.h"

namespace fasttdms {
namespace runtime {
namespace io {

absl::StatusOr<std::vector<uint8_t>> MemorySource::ReadAt(
    uint64_t offset, uint64_t length) const {
  if (offset >= bytes_.size()) {
    return std::vector<uint8_t>{};
  }
  const uint64_t available = std::min<uint64_t>(length, bytes_.size() - offset);
  return std::vector<uint8_t>(bytes_.begin() + offset,
                              bytes_.begin() + offset + available);
}

absl::StatusOr<std::unique_ptr<FileSource>> FileSource::Open(
    const fs::path& path) {
  const int fd = ::open(path.string().c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       absl::StrFormat("Cannot open file: %s (%s)",
                                       path.string(), std::strerror(errno)));
  }
  return std::unique_ptr<FileSource>(new FileSource(fd, path));
}

FileSource::~FileSource() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

absl::StatusOr<std::vector<uint8_t>> FileSource::ReadAt(uint64_t offset,
                                                        uint64_t length) const {
  std::vector<uint8_t> buffer(length);
  uint64_t filled = 0;
  while (filled < length) {
    const ssize_t n = ::pread(fd_, buffer.data() + filled, length - filled,
                              static_cast<off_t>(offset + filled));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return MAKE_STATUS(
          absl::StatusCode::kInternal,
          absl::StrFormat("Failed to read %d bytes at offset %d from %s: %s",
                          length, offset, path_.string(),
                          std::strerror(errno)));
    }
    if (n == 0) {
      break;  // end of file
    }
    filled += static_cast<uint64_t>(n);
  }
  buffer.resize(filled);
  return buffer;
}

absl::StatusOr<uint64_t> FileSource::GetLength() const {
  struct stat info {};
  if (::fstat(fd_, &info) != 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       absl::StrFormat("Failed to determine size of %s: %s",
                                       path_.string(), std::strerror(errno)));
  }
  return static_cast<uint64_t>(info.st_size);
}

}  // namespace io
}  // namespace runtime
}  // namespace fasttdms
