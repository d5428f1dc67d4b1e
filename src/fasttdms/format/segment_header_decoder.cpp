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

#include "fasttdms/format/segment_header_decoder.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "fasttdms/core/errors.h"
#include "fasttdms/core/object_path.h"
#include "fasttdms/format/constants.h"
#include "fasttdms/runtime/io/element_decoder.h"
#include "fasttdms/status/status_macros.h"

namespace fasttdms {
namespace format {

namespace {

absl::Status FormatError(const std::string& detail) {
  return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                     absl::StrFormat("%s %s", errors::kFormatError, detail));
}

}  // namespace

SegmentHeaderDecoder::SegmentHeaderDecoder(OpenOptions options)
    : options_(options) {}

absl::StatusOr<std::optional<SegmentDescriptor>> SegmentHeaderDecoder::Decode(
    const RandomAccessSource& source, uint64_t offset, uint64_t file_length) {
  if (offset >= file_length) {
    return std::nullopt;
  }

  DECLARE_ASSIGN_OR_RETURN(std::vector<uint8_t>, lead_in_bytes,
                           source.ReadAt(offset, kLeadInSize),
                           "Failed to read segment lead-in");
  if (lead_in_bytes.size() < kLeadInSize) {
    LOG(WARNING) << "Ignoring incomplete segment lead-in at offset " << offset
                 << " (" << lead_in_bytes.size() << " of " << kLeadInSize
                 << " bytes)";
    return std::nullopt;
  }

  DECLARE_ASSIGN_OR_RETURN(LeadIn, lead_in,
                           ParseLeadIn(lead_in_bytes, offset),
                           "Invalid segment lead-in");

  const uint64_t lead_in_end = offset + kLeadInSize;
  const bool length_known =
      lead_in.next_segment_offset != kUnknownSegmentLength;

  if (length_known && lead_in.raw_data_offset > lead_in.next_segment_offset) {
    return FormatError(absl::StrFormat(
        "segment at %d has raw data offset %d beyond its length %d", offset,
        lead_in.raw_data_offset, lead_in.next_segment_offset));
  }
  if (lead_in.Has(toc::kMetaData) &&
      lead_in.raw_data_offset > options_.max_metadata_bytes) {
    return FormatError(absl::StrFormat(
        "segment at %d declares %d metadata bytes (limit %d)", offset,
        lead_in.raw_data_offset, options_.max_metadata_bytes));
  }

  SegmentDescriptor descriptor;
  descriptor.header_offset = offset;
  descriptor.raw_data_offset = lead_in_end + lead_in.raw_data_offset;
  descriptor.byte_order = lead_in.byte_order;
  descriptor.layout = lead_in.Has(toc::kInterleavedData)
                          ? LayoutKind::kInterleaved
                          : LayoutKind::kContiguous;

  if (lead_in.Has(toc::kNewObjList)) {
    active_channels_.clear();
  }

  if (lead_in.Has(toc::kMetaData)) {
    DECLARE_ASSIGN_OR_RETURN(
        std::vector<uint8_t>, metadata,
        source.ReadAt(lead_in_end,
                      std::min(lead_in.raw_data_offset,
                               file_length - lead_in_end)),
        "Failed to read segment metadata");
    if (metadata.size() < lead_in.raw_data_offset) {
      LOG(WARNING) << "Ignoring segment at offset " << offset
                   << ": metadata cut short by end of file ("
                   << metadata.size() << " of " << lead_in.raw_data_offset
                   << " bytes)";
      return std::nullopt;
    }
    ByteCursor cursor(metadata, lead_in.byte_order);
    RETURN_IF_ERROR(ParseMetadata(cursor, descriptor),
                    absl::StrFormat("Invalid metadata in segment at %d",
                                    offset));
  }

  if (!length_known) {
    VLOG(1) << "Segment at " << offset << " has unknown length";
  } else if (lead_in_end + lead_in.next_segment_offset > file_length) {
    LOG(WARNING) << "Segment at offset " << offset << " declares "
                 << lead_in.next_segment_offset
                 << " bytes but the file ends at " << file_length
                 << "; treating its length as unknown";
  } else {
    descriptor.raw_data_length =
        lead_in.next_segment_offset - lead_in.raw_data_offset;
    descriptor.next_segment_offset =
        lead_in_end + lead_in.next_segment_offset;
  }

  if (lead_in.Has(toc::kRawData)) {
    RETURN_IF_ERROR(ResolveChannels(lead_in, descriptor),
                    absl::StrFormat("Invalid channel list in segment at %d",
                                    offset));
  }

  VLOG(2) << "Decoded segment at " << offset << ": "
          << descriptor.channels.size() << " channel(s), "
          << descriptor.objects.size() << " object update(s)";
  return descriptor;
}

absl::StatusOr<SegmentHeaderDecoder::LeadIn> SegmentHeaderDecoder::ParseLeadIn(
    std::span<const uint8_t> bytes, uint64_t offset) const {
  if (!std::equal(kSegmentTag.begin(), kSegmentTag.end(), bytes.begin())) {
    return FormatError(
        absl::StrFormat("missing segment tag at offset %d", offset));
  }

  LeadIn lead_in;
  lead_in.toc = runtime::io::LoadScalar<uint32_t>(bytes.data() + 4,
                                                  ByteOrder::kLittle);
  lead_in.byte_order = lead_in.Has(toc::kBigEndian) ? ByteOrder::kBig
                                                    : ByteOrder::kLittle;

  ByteCursor cursor(bytes.subspan(8), lead_in.byte_order);
  ASSIGN_OR_RETURN(lead_in.version, cursor.ReadU32());
  ASSIGN_OR_RETURN(lead_in.next_segment_offset, cursor.ReadU64());
  ASSIGN_OR_RETURN(lead_in.raw_data_offset, cursor.ReadU64());

  if (lead_in.version != kVersion4712 && lead_in.version != kVersion4713) {
    if (options_.strict_version) {
      return FormatError(absl::StrFormat(
          "unsupported version %d at offset %d", lead_in.version, offset));
    }
    VLOG(1) << "Reading segment version " << lead_in.version
            << " with version " << kVersion4713 << " rules";
  }
  return lead_in;
}

absl::Status SegmentHeaderDecoder::ParseMetadata(
    ByteCursor& cursor, SegmentDescriptor& descriptor) {
  DECLARE_ASSIGN_OR_RETURN(uint32_t, object_count, cursor.ReadU32(),
                           "Cannot read object count");

  for (uint32_t i = 0; i < object_count; ++i) {
    DECLARE_ASSIGN_OR_RETURN(std::string, path_text, cursor.ReadString(),
                             "Cannot read object path");
    DECLARE_ASSIGN_OR_RETURN(ObjectPath, path, ObjectPath::Parse(path_text),
                             "Invalid object path");
    ObjectUpdate update{.path = path.ToString(), .properties = {}};

    DECLARE_ASSIGN_OR_RETURN(uint32_t, raw_index, cursor.ReadU32(),
                             "Cannot read raw data index");
    if (raw_index != kRawIndexNoData && !path.IsChannel()) {
      return FormatError(absl::StrFormat(
          "object %s is not a channel but has raw data", update.path));
    }

    switch (raw_index) {
      case kRawIndexNoData:
        break;
      case kRawIndexMatchPrevious:
        if (formats_.find(update.path) == formats_.end()) {
          return FormatError(absl::StrFormat(
              "channel %s reuses a raw data index it never had",
              update.path));
        }
        Activate(update.path);
        break;
      case kRawIndexDAQmxFormatChanging:
      case kRawIndexDAQmxDigitalLine:
        return FormatError(absl::StrFormat(
            "channel %s uses DAQmx raw data, which is not supported",
            update.path));
      default: {
        DECLARE_ASSIGN_OR_RETURN(
            ChannelFormat, format,
            ParseRawDataIndex(cursor, raw_index, update.path),
            absl::StrFormat("Invalid raw data index for %s", update.path));
        formats_[update.path] = format;
        Activate(update.path);
        break;
      }
    }

    RETURN_IF_ERROR(ParseProperties(cursor, update),
                    absl::StrFormat("Invalid properties for %s", update.path));
    descriptor.objects.push_back(std::move(update));
  }

  if (cursor.remaining() > 0) {
    VLOG(2) << "Ignoring " << cursor.remaining()
            << " byte(s) after the last object";
  }
  return absl::OkStatus();
}

absl::StatusOr<SegmentHeaderDecoder::ChannelFormat>
SegmentHeaderDecoder::ParseRawDataIndex(ByteCursor& cursor,
                                        uint32_t index_length,
                                        const std::string& path) {
  if (index_length != kRawIndexFixedLength &&
      index_length != kRawIndexStringLength) {
    return FormatError(absl::StrFormat(
        "raw data index of %s has length %d", path, index_length));
  }

  DECLARE_ASSIGN_OR_RETURN(uint32_t, type_tag, cursor.ReadU32(),
                           "Cannot read data type");
  DECLARE_ASSIGN_OR_RETURN(uint32_t, dimension, cursor.ReadU32(),
                           "Cannot read dimension");
  DECLARE_ASSIGN_OR_RETURN(uint64_t, value_count, cursor.ReadU64(),
                           "Cannot read value count");

  if (!IsKnownDataType(type_tag)) {
    return FormatError(
        absl::StrFormat("channel %s has unknown data type 0x%x", path,
                        type_tag));
  }
  if (dimension != 1) {
    return FormatError(absl::StrFormat(
        "channel %s has array dimension %d (must be 1)", path, dimension));
  }

  const auto type = static_cast<DataType>(type_tag);
  if (type == DataType::kDAQmxRawData || type == DataType::kVoid) {
    return FormatError(absl::StrFormat("channel %s cannot store %s raw data",
                                       path, DataTypeName(type)));
  }

  ChannelFormat format{.data_type = type,
                       .width = FixedWidth(type).value_or(0),
                       .value_count = value_count,
                       .total_size_bytes = 0};

  if (type == DataType::kString) {
    if (index_length != kRawIndexStringLength) {
      return FormatError(absl::StrFormat(
          "string channel %s lacks its total size", path));
    }
    ASSIGN_OR_RETURN(format.total_size_bytes, cursor.ReadU64(),
                     "Cannot read total size");
  } else if (index_length == kRawIndexStringLength) {
    // Fixed-width channels carry no meaningful size field
    RETURN_IF_ERROR(cursor.Skip(sizeof(uint64_t)), "Cannot skip total size");
  }
  return format;
}

absl::Status SegmentHeaderDecoder::ParseProperties(ByteCursor& cursor,
                                                   ObjectUpdate& update) {
  DECLARE_ASSIGN_OR_RETURN(uint32_t, property_count, cursor.ReadU32(),
                           "Cannot read property count");
  update.properties.reserve(property_count);

  for (uint32_t i = 0; i < property_count; ++i) {
    DECLARE_ASSIGN_OR_RETURN(std::string, name, cursor.ReadString(),
                             "Cannot read property name");
    DECLARE_ASSIGN_OR_RETURN(uint32_t, type_tag, cursor.ReadU32(),
                             "Cannot read property type");
    if (!IsKnownDataType(type_tag)) {
      return FormatError(absl::StrFormat(
          "property %s has unknown data type 0x%x", name, type_tag));
    }
    const auto type = static_cast<DataType>(type_tag);

    auto value = cursor.ReadPropertyValue(type);
    if (value.ok()) {
      update.properties.emplace_back(std::move(name), *std::move(value));
      continue;
    }
    if (!errors::IsUnsupportedType(value.status())) {
      return status::AddTrace(value.status(), __func__, __FILE__, __LINE__,
                              absl::StrFormat("Cannot read property %s",
                                              name));
    }

    const auto width = FixedWidth(type);
    if (!width.has_value()) {
      return FormatError(absl::StrFormat(
          "property %s of type %s cannot be skipped", name,
          DataTypeName(type)));
    }
    LOG(WARNING) << "Skipping property " << name << " of " << update.path
                 << ": " << DataTypeName(type) << " values are not supported";
    RETURN_IF_ERROR(cursor.Skip(*width), "Cannot skip property value");
  }
  return absl::OkStatus();
}

absl::Status SegmentHeaderDecoder::ResolveChannels(
    const LeadIn& lead_in, SegmentDescriptor& descriptor) const {
  if (lead_in.Has(toc::kDAQmxRawData)) {
    return FormatError("DAQmx raw data segments are not supported");
  }

  descriptor.channels.reserve(active_channels_.size());
  for (const auto& path : active_channels_) {
    const ChannelFormat& format = formats_.at(path);
    descriptor.channels.push_back(
        ChannelEntry{.path = path,
                     .data_type = format.data_type,
                     .width = format.width,
                     .value_count = format.value_count,
                     .total_size_bytes = format.total_size_bytes});
  }

  for (const auto& entry : descriptor.channels) {
    if (entry.value_count != descriptor.channels.front().value_count) {
      return FormatError(absl::StrFormat(
          "channel %s stores %d values per chunk but %s stores %d",
          entry.path, entry.value_count, descriptor.channels.front().path,
          descriptor.channels.front().value_count));
    }
    if (descriptor.layout == LayoutKind::kInterleaved &&
        entry.IsVariableWidth()) {
      return FormatError(absl::StrFormat(
          "variable-width channel %s in an interleaved segment", entry.path));
    }
  }
  return absl::OkStatus();
}

void SegmentHeaderDecoder::Activate(const std::string& path) {
  if (std::find(active_channels_.begin(), active_channels_.end(), path) ==
      active_channels_.end()) {
    active_channels_.push_back(path);
  }
}

// ============================================================================
// SegmentStream
// ============================================================================

SegmentStream::SegmentStream(const RandomAccessSource& source,
                             uint64_t file_length, OpenOptions options)
    : source_(source),
      file_length_(file_length),
      next_offset_(0),
      decoder_(options) {}

absl::StatusOr<std::optional<SegmentDescriptor>> SegmentStream::Next() {
  if (!next_offset_.has_value()) {
    return std::nullopt;
  }

  DECLARE_ASSIGN_OR_RETURN(
      std::optional<SegmentDescriptor>, descriptor,
      decoder_.Decode(source_, *next_offset_, file_length_),
      absl::StrFormat("Failed to decode segment %d", segment_count_));

  if (!descriptor.has_value()) {
    next_offset_.reset();
    return std::nullopt;
  }

  next_offset_ = descriptor->next_segment_offset;
  ++segment_count_;
  return descriptor;
}

}  // namespace format
}  // namespace fasttdms
