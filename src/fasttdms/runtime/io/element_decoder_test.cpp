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

#include "fasttdms/runtime/io/element_decoder.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <variant>
#include <vector>

#include "fasttdms/core/errors.h"
#include "fasttdms/testing/segment_builder.h"

namespace fasttdms {
namespace runtime {
namespace io {

using fasttdms::testing::EncodeValues;

// ============================================================================
// DecodeElement Tests
// ============================================================================

TEST(DecodeElementTest, LittleEndianI32) {
  const std::vector<uint8_t> bytes = {0x78, 0x56, 0x34, 0x12};
  auto value = DecodeElement(bytes, DataType::kI32, ByteOrder::kLittle);
  ASSERT_TRUE(value.ok()) << value.status();
  EXPECT_EQ(std::get<int32_t>(*value), 0x12345678);
}

TEST(DecodeElementTest, BigEndianI32) {
  const std::vector<uint8_t> bytes = {0x12, 0x34, 0x56, 0x78};
  auto value = DecodeElement(bytes, DataType::kI32, ByteOrder::kBig);
  ASSERT_TRUE(value.ok()) << value.status();
  EXPECT_EQ(std::get<int32_t>(*value), 0x12345678);
}

TEST(DecodeElementTest, DoubleBothOrders) {
  for (ByteOrder order : {ByteOrder::kLittle, ByteOrder::kBig}) {
    auto bytes = EncodeValues<double>({-1.25}, order);
    auto value = DecodeElement(bytes, DataType::kDoubleFloat, order);
    ASSERT_TRUE(value.ok()) << value.status();
    EXPECT_DOUBLE_EQ(std::get<double>(*value), -1.25);
  }
}

TEST(DecodeElementTest, UnitVariantsDecodeAsPlainFloats) {
  auto bytes = EncodeValues<float>({3.5f}, ByteOrder::kLittle);
  auto value =
      DecodeElement(bytes, DataType::kSingleFloatWithUnit, ByteOrder::kLittle);
  ASSERT_TRUE(value.ok()) << value.status();
  EXPECT_FLOAT_EQ(std::get<float>(*value), 3.5f);
}

TEST(DecodeElementTest, BooleanIsNonZero) {
  const std::vector<uint8_t> zero = {0x00};
  const std::vector<uint8_t> other = {0x7F};
  EXPECT_FALSE(std::get<bool>(
      *DecodeElement(zero, DataType::kBoolean, ByteOrder::kLittle)));
  EXPECT_TRUE(std::get<bool>(
      *DecodeElement(other, DataType::kBoolean, ByteOrder::kLittle)));
}

TEST(DecodeElementTest, TimestampFieldOrderFollowsByteOrder) {
  const Timestamp expected{.seconds = 3600, .fractions = 0x8000000000000000};
  for (ByteOrder order : {ByteOrder::kLittle, ByteOrder::kBig}) {
    auto bytes = EncodeValues<Timestamp>({expected}, order);
    ASSERT_EQ(bytes.size(), 16u);
    auto value = DecodeElement(bytes, DataType::kTimeStamp, order);
    ASSERT_TRUE(value.ok()) << value.status();
    EXPECT_EQ(std::get<Timestamp>(*value), expected);
  }

  // Little-endian stores the fractions first
  auto le = EncodeValues<Timestamp>({expected}, ByteOrder::kLittle);
  EXPECT_EQ(le[7], 0x80);
  EXPECT_EQ(le[8], 0x10);  // 3600 = 0x0E10
}

TEST(DecodeElementTest, UnsupportedTypes) {
  const std::vector<uint8_t> bytes(16, 0);
  for (DataType type : {DataType::kExtendedFloat, DataType::kComplexSingleFloat,
                        DataType::kFixedPoint, DataType::kString}) {
    auto value = DecodeElement(bytes, type, ByteOrder::kLittle);
    ASSERT_FALSE(value.ok());
    EXPECT_TRUE(errors::IsUnsupportedType(value.status())) << value.status();
  }
}

TEST(DecodeElementTest, ShortInput) {
  const std::vector<uint8_t> bytes = {0x01, 0x02};
  auto value = DecodeElement(bytes, DataType::kU32, ByteOrder::kLittle);
  EXPECT_EQ(value.status().code(), absl::StatusCode::kInvalidArgument);
}

// ============================================================================
// DecodeElements Tests
// ============================================================================

TEST(DecodeElementsTest, ContiguousRun) {
  auto bytes = EncodeValues<uint16_t>({10, 20, 30, 40}, ByteOrder::kBig);
  ChannelData out = std::vector<uint16_t>{};

  ASSERT_TRUE(DecodeElements(bytes, 2, 2, 3, DataType::kU16, ByteOrder::kBig,
                             out)
                  .ok());
  EXPECT_EQ(*GetValues<uint16_t>(out), (std::vector<uint16_t>{20, 30, 40}));
}

TEST(DecodeElementsTest, StridedRecords) {
  // Records of (i32, u8): 5 bytes each
  std::vector<uint8_t> bytes;
  for (int32_t i = 0; i < 4; ++i) {
    auto value = EncodeValues<int32_t>({i * 100}, ByteOrder::kLittle);
    bytes.insert(bytes.end(), value.begin(), value.end());
    bytes.push_back(static_cast<uint8_t>(i));
  }

  ChannelData ints = std::vector<int32_t>{};
  ASSERT_TRUE(DecodeElements(bytes, 0, 5, 4, DataType::kI32,
                             ByteOrder::kLittle, ints)
                  .ok());
  EXPECT_EQ(*GetValues<int32_t>(ints),
            (std::vector<int32_t>{0, 100, 200, 300}));

  ChannelData small = std::vector<uint8_t>{};
  ASSERT_TRUE(DecodeElements(bytes, 4, 5, 4, DataType::kU8,
                             ByteOrder::kLittle, small)
                  .ok());
  EXPECT_EQ(*GetValues<uint8_t>(small), (std::vector<uint8_t>{0, 1, 2, 3}));
}

TEST(DecodeElementsTest, AppendsToExistingValues) {
  auto bytes = EncodeValues<int8_t>({5, 6}, ByteOrder::kLittle);
  ChannelData out = std::vector<int8_t>{4};
  ASSERT_TRUE(
      DecodeElements(bytes, 0, 1, 2, DataType::kI8, ByteOrder::kLittle, out)
          .ok());
  EXPECT_EQ(*GetValues<int8_t>(out), (std::vector<int8_t>{4, 5, 6}));
}

TEST(DecodeElementsTest, RejectsOverrun) {
  auto bytes = EncodeValues<int32_t>({1, 2}, ByteOrder::kLittle);
  ChannelData out = std::vector<int32_t>{};
  auto status =
      DecodeElements(bytes, 4, 4, 2, DataType::kI32, ByteOrder::kLittle, out);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
}

TEST(DecodeElementsTest, RejectsWrongColumn) {
  auto bytes = EncodeValues<int32_t>({1}, ByteOrder::kLittle);
  ChannelData out = std::vector<double>{};
  auto status =
      DecodeElements(bytes, 0, 4, 1, DataType::kI32, ByteOrder::kLittle, out);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
}

TEST(DecodeElementsTest, RejectsUnsupportedType) {
  const std::vector<uint8_t> bytes(32, 0);
  ChannelData out = std::vector<double>{};
  auto status = DecodeElements(bytes, 0, 16, 2, DataType::kExtendedFloat,
                               ByteOrder::kLittle, out);
  EXPECT_TRUE(errors::IsUnsupportedType(status)) << status;
}

}  // namespace io
}  // namespace runtime
}  // namespace fasttdms
