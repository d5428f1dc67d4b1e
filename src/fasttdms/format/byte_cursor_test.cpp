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

#include "fasttdms/format/byte_cursor.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "fasttdms/core/errors.h"
#include "fasttdms/testing/segment_builder.h"

namespace fasttdms {
namespace format {

namespace {

std::vector<uint8_t> LengthPrefixed(const std::string& text, ByteOrder order) {
  std::vector<uint8_t> out;
  testing::PutScalar<uint32_t>(out, static_cast<uint32_t>(text.size()), order);
  out.insert(out.end(), text.begin(), text.end());
  return out;
}

}  // namespace

TEST(ByteCursorTest, ReadsIntegersInBothOrders) {
  const std::vector<uint8_t> bytes = {0x01, 0x02, 0x03, 0x04};

  ByteCursor little(bytes, ByteOrder::kLittle);
  auto le = little.ReadU32();
  ASSERT_TRUE(le.ok()) << le.status();
  EXPECT_EQ(*le, 0x04030201u);
  EXPECT_EQ(little.remaining(), 0u);

  ByteCursor big(bytes, ByteOrder::kBig);
  auto be = big.ReadU32();
  ASSERT_TRUE(be.ok()) << be.status();
  EXPECT_EQ(*be, 0x01020304u);
}

TEST(ByteCursorTest, ShortReadIsFormatError) {
  const std::vector<uint8_t> bytes = {0x01, 0x02, 0x03};
  ByteCursor cursor(bytes, ByteOrder::kLittle);

  auto value = cursor.ReadU32();
  ASSERT_FALSE(value.ok());
  EXPECT_TRUE(errors::IsFormatError(value.status())) << value.status();
  EXPECT_EQ(cursor.position(), 0u);
}

TEST(ByteCursorTest, ReadsStrings) {
  std::vector<uint8_t> bytes = LengthPrefixed("/'g'", ByteOrder::kBig);
  auto tail = LengthPrefixed("", ByteOrder::kBig);
  bytes.insert(bytes.end(), tail.begin(), tail.end());

  ByteCursor cursor(bytes, ByteOrder::kBig);
  auto first = cursor.ReadString();
  auto second = cursor.ReadString();
  ASSERT_TRUE(first.ok()) << first.status();
  ASSERT_TRUE(second.ok()) << second.status();
  EXPECT_EQ(*first, "/'g'");
  EXPECT_EQ(*second, "");
  EXPECT_EQ(cursor.remaining(), 0u);
}

TEST(ByteCursorTest, StringLongerThanBlock) {
  std::vector<uint8_t> bytes = LengthPrefixed("abc", ByteOrder::kLittle);
  bytes.pop_back();

  ByteCursor cursor(bytes, ByteOrder::kLittle);
  auto text = cursor.ReadString();
  ASSERT_FALSE(text.ok());
  EXPECT_TRUE(errors::IsFormatError(text.status())) << text.status();
}

TEST(ByteCursorTest, PropertyValues) {
  std::vector<uint8_t> bytes;
  testing::PutScalar<double>(bytes, 2.5, ByteOrder::kLittle);
  bytes.push_back(1);
  auto text = LengthPrefixed("mV", ByteOrder::kLittle);
  bytes.insert(bytes.end(), text.begin(), text.end());

  ByteCursor cursor(bytes, ByteOrder::kLittle);
  auto number = cursor.ReadPropertyValue(DataType::kDoubleFloat);
  auto flag = cursor.ReadPropertyValue(DataType::kBoolean);
  auto unit = cursor.ReadPropertyValue(DataType::kString);
  ASSERT_TRUE(number.ok()) << number.status();
  ASSERT_TRUE(flag.ok()) << flag.status();
  ASSERT_TRUE(unit.ok()) << unit.status();

  EXPECT_EQ(std::get<double>(*number), 2.5);
  EXPECT_TRUE(std::get<bool>(*flag));
  EXPECT_EQ(std::get<std::string>(*unit), "mV");
  EXPECT_EQ(cursor.remaining(), 0u);
}

TEST(ByteCursorTest, UnsupportedPropertyKeepsPosition) {
  const std::vector<uint8_t> bytes(16, 0);
  ByteCursor cursor(bytes, ByteOrder::kLittle);

  auto value = cursor.ReadPropertyValue(DataType::kExtendedFloat);
  ASSERT_FALSE(value.ok());
  EXPECT_TRUE(errors::IsUnsupportedType(value.status())) << value.status();
  EXPECT_EQ(cursor.position(), 0u);

  ASSERT_TRUE(cursor.Skip(16).ok());
  EXPECT_EQ(cursor.remaining(), 0u);
  EXPECT_FALSE(cursor.Skip(1).ok());
}

}  // namespace format
}  // namespace fasttdms
