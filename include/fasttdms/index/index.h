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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_INDEX_INDEX_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_INDEX_INDEX_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fasttdms/core/data_location.h"
#include "fasttdms/core/property.h"
#include "fasttdms/core/read_plan.h"
#include "fasttdms/core/segment_descriptor.h"

/// @file index.h
/// @brief In-memory index of a TDMS file
///
/// The Index is built by one sequential pass over the segment headers and
/// records, for every channel, where each of its values lives on disk. It is
/// immutable once built, so any number of threads may plan queries against
/// one Index without synchronization.

namespace fasttdms {

class IndexBuilder;

/// @brief Part of one DataLocation selected by a lookup
struct LocationSlice {
  const DataLocation* location;  ///< Location inside the Index (never null)
  uint64_t local_start = 0;      ///< First value within the location
  uint64_t count = 0;            ///< Values taken from the location
  uint64_t global_start = 0;     ///< Global index of the first value
};

/// @brief Summary of a registered channel
struct ChannelInfo {
  std::string path;                      ///< Canonical channel path
  std::string group;                     ///< Group name
  std::string name;                      ///< Channel name
  DataType data_type = DataType::kVoid;  ///< Type of the latest data location
  uint64_t total_values = 0;             ///< Values across all segments
  size_t location_count = 0;             ///< Number of data locations
};

/// @brief Channel registry, group registry and segment table of one file
class Index {
 public:
  Index() = default;

  Index(Index&&) noexcept = default;
  Index& operator=(Index&&) noexcept = default;
  Index(const Index&) = delete;
  Index& operator=(const Index&) = delete;

  /// @brief Build an index by draining a descriptor source
  ///
  /// Descriptors are consumed strictly in file order with an explicit loop.
  ///
  /// @param source Descriptor source positioned at the first segment
  /// @param file_length Length of the file, used to clamp unknown lengths
  /// @return Index or the first FormatError
  static absl::StatusOr<Index> Build(SegmentDescriptorSource& source,
                                     uint64_t file_length);

  /// @brief Map a global value range of a channel to per-location slices
  ///
  /// Binary-searches the channel's cumulative value counts. The first and
  /// last slice are clipped to the requested boundaries. An open-ended range
  /// extends to the last recorded value; an empty range yields no slices.
  ///
  /// @retval absl::NotFoundError (UnknownChannel) if the path is unknown
  /// @retval absl::OutOfRangeError (RangeOutOfBounds) if the range exceeds
  /// the channel's recorded values
  absl::StatusOr<std::vector<LocationSlice>> Lookup(std::string_view path,
                                                    ValueRange range) const;

  /// @brief Current property snapshot of the root, a group or a channel
  /// @retval absl::NotFoundError (UnknownChannel / UnknownGroup)
  /// @retval absl::InvalidArgumentError for malformed paths
  absl::StatusOr<PropertyMap> Properties(std::string_view path) const;

  /// @brief Total recorded values of a channel
  /// @retval absl::NotFoundError (UnknownChannel)
  absl::StatusOr<uint64_t> TotalValues(std::string_view path) const;

  /// @brief Summary of a channel
  /// @retval absl::NotFoundError (UnknownChannel)
  absl::StatusOr<ChannelInfo> GetChannelInfo(std::string_view path) const;

  /// @brief Data locations of a channel in file order
  /// @retval absl::NotFoundError (UnknownChannel)
  absl::StatusOr<std::vector<DataLocation>> GetLocations(
      std::string_view path) const;

  [[nodiscard]] bool HasChannel(std::string_view path) const;

  /// @brief Group names in registration order
  [[nodiscard]] std::vector<std::string> GroupNames() const;

  /// @brief Channel paths of a group in registration order
  /// @retval absl::NotFoundError (UnknownGroup)
  absl::StatusOr<std::vector<std::string>> ChannelPaths(
      std::string_view group) const;

  /// @brief All segments in file order
  [[nodiscard]] const std::vector<SegmentInfo>& GetSegments() const {
    return segments_;
  }

  /// @brief Segment by ordinal (must be < GetSegments().size())
  [[nodiscard]] const SegmentInfo& GetSegment(uint32_t ordinal) const {
    return segments_[ordinal];
  }

  [[nodiscard]] size_t GetChannelCount() const { return channels_.size(); }

  [[nodiscard]] uint64_t GetFileLength() const { return file_length_; }

 private:
  friend class IndexBuilder;

  struct ChannelRecord {
    std::string path;
    std::string group;
    std::string name;
    std::vector<DataLocation> locations;
    /// cumulative[i] = values stored before locations[i]; one extra entry
    /// at the end holds the total.
    std::vector<uint64_t> cumulative{0};
    PropertyMap properties;
  };

  struct GroupRecord {
    std::string name;
    PropertyMap properties;
    std::vector<uint32_t> channel_ids;
  };

  const ChannelRecord* FindChannel(std::string_view path) const;

  std::vector<SegmentInfo> segments_;
  std::vector<ChannelRecord> channels_;
  std::unordered_map<std::string, uint32_t> channel_ids_;
  std::vector<GroupRecord> groups_;
  std::unordered_map<std::string, uint32_t> group_ids_;
  PropertyMap root_properties_;
  uint64_t file_length_ = 0;
};

/// @brief Append-only construction of an Index
///
/// Example usage:
/// ```cpp
/// IndexBuilder builder(file_length);
/// for (const auto& descriptor : descriptors) {
///   RETURN_IF_ERROR(builder.AddSegment(descriptor), "Indexing failed");
/// }
/// Index index = std::move(builder).Build();
/// ```
class IndexBuilder {
 public:
  explicit IndexBuilder(uint64_t file_length);

  /// @brief Add the next segment in file order
  ///
  /// Clamps an unknown raw data length to the end of the file, derives the
  /// number of complete values per channel (dropping the bytes of an
  /// incomplete trailing write), appends one DataLocation per channel and
  /// merges property updates (same name replaces, others persist).
  ///
  /// @retval absl::InvalidArgumentError (FormatError) for layouts that cannot
  /// be indexed, e.g. variable-width channels in an interleaved block or a
  /// declared raw data block extending past the end of the file
  absl::Status AddSegment(const SegmentDescriptor& descriptor);

  /// @brief Number of segments added so far
  [[nodiscard]] size_t GetSegmentCount() const {
    return index_.segments_.size();
  }

  /// @brief Finish building
  Index Build() &&;

 private:
  absl::Status ApplyObjectUpdate(const ObjectUpdate& update);
  absl::StatusOr<uint32_t> EnsureChannel(std::string_view path);
  uint32_t EnsureGroup(const std::string& name);

  void AddInterleavedLocations(const SegmentDescriptor& descriptor,
                               SegmentInfo& segment,
                               const std::vector<uint32_t>& channel_ids);
  void AddContiguousLocations(const SegmentDescriptor& descriptor,
                              SegmentInfo& segment,
                              const std::vector<uint32_t>& channel_ids);
  void AppendLocation(uint32_t channel_id, const DataLocation& location);

  Index index_;
};

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_INDEX_INDEX_H_
