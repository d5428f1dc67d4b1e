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

#include "fasttdms/core/segment_descriptor.h"

#include <gtest/gtest.h>

#include <cstdint>

namespace fasttdms {
namespace core {

TEST(ChannelEntryTest, DefaultsDescribeAnEmptyChannel) {
  const ChannelEntry entry{.path = "/'g'/'a'"};
  EXPECT_EQ(entry.data_type, DataType::kVoid);
  EXPECT_EQ(entry.width, 0u);
  EXPECT_EQ(entry.value_count, 0u);
  EXPECT_EQ(entry.ChunkBytes(), 0u);
  EXPECT_TRUE(entry.IsVariableWidth());
}

TEST(ChannelEntryTest, ChunkBytes) {
  const ChannelEntry fixed{.path = "/'g'/'a'",
                           .data_type = DataType::kI32,
                           .width = 4,
                           .value_count = 5};
  EXPECT_EQ(fixed.ChunkBytes(), 20u);
  EXPECT_FALSE(fixed.IsVariableWidth());

  const ChannelEntry text{.path = "/'g'/'s'",
                          .data_type = DataType::kString,
                          .value_count = 3,
                          .total_size_bytes = 42};
  EXPECT_EQ(text.ChunkBytes(), 42u);
}

TEST(SegmentDescriptorTest, DefaultsHaveNoRawData) {
  SegmentDescriptor descriptor;
  EXPECT_EQ(descriptor.raw_data_offset, 0u);
  EXPECT_FALSE(descriptor.raw_data_length.has_value());
  EXPECT_TRUE(descriptor.channels.empty());
  EXPECT_FALSE(descriptor.HasRawData());
}

}  // namespace core
}  // namespace fasttdms
