/******************************************************************************
 * Copyright 2026 ETC Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 ******************************************************************************
 * This file is a part of AmpLink.
 *****************************************************************************/

#include "amplink/core/util.h"

#include <cstring>
#include "gtest/gtest.h"

TEST(TestTextField, AsciiDecodes)
{
  const uint8_t field[] = {'A', 'm', 'p', ' ', '1'};
  auto          text = amplink::DecodeTextField(field, sizeof(field));
  ASSERT_TRUE(text);
  EXPECT_EQ(*text, "Amp 1");
}

// Fixed-width fields are NUL-padded, and devices have been seen to pad with NULs in the middle of
// a name as well.
TEST(TestTextField, NulBytesAreRemoved)
{
  const uint8_t trailing[8] = {'K', 'i', 't', 'c', 'h', 'e', 'n', 0};
  auto          text = amplink::DecodeTextField(trailing, sizeof(trailing));
  ASSERT_TRUE(text);
  EXPECT_EQ(*text, "Kitchen");

  const uint8_t embedded[] = {'A', 0, 'B', 0, 0, 'C'};
  text = amplink::DecodeTextField(embedded, sizeof(embedded));
  ASSERT_TRUE(text);
  EXPECT_EQ(*text, "ABC");
}

TEST(TestTextField, AllNulIsEmpty)
{
  const uint8_t field[16] = {};
  auto          text = amplink::DecodeTextField(field, sizeof(field));
  ASSERT_TRUE(text);
  EXPECT_TRUE(text->empty());
}

TEST(TestTextField, MultibyteUtf8Decodes)
{
  const char* name = u8"Salle à manger ♫";
  auto        text = amplink::DecodeTextField(reinterpret_cast<const uint8_t*>(name), std::strlen(name));
  ASSERT_TRUE(text);
  EXPECT_EQ(*text, name);
}

TEST(TestTextField, InvalidUtf8IsRejected)
{
  const uint8_t bad_lead[] = {'A', 0xff, 'B'};
  EXPECT_EQ(amplink::DecodeTextField(bad_lead, sizeof(bad_lead)).error_code(), kEtcPalErrProtErr);

  const uint8_t truncated[] = {'A', 0xe2, 0x99};
  EXPECT_EQ(amplink::DecodeTextField(truncated, sizeof(truncated)).error_code(), kEtcPalErrProtErr);
}

TEST(TestTextField, Utf8EdgeCases)
{
  // Overlong encoding of '/'
  const uint8_t overlong[] = {0xc0, 0xaf};
  EXPECT_FALSE(amplink::IsValidUtf8(overlong, sizeof(overlong)));

  // Encoded UTF-16 surrogate U+D800
  const uint8_t surrogate[] = {0xed, 0xa0, 0x80};
  EXPECT_FALSE(amplink::IsValidUtf8(surrogate, sizeof(surrogate)));

  // U+110000 is past the end of the code space
  const uint8_t too_big[] = {0xf4, 0x90, 0x80, 0x80};
  EXPECT_FALSE(amplink::IsValidUtf8(too_big, sizeof(too_big)));

  // U+10FFFF is the last valid code point
  const uint8_t last[] = {0xf4, 0x8f, 0xbf, 0xbf};
  EXPECT_TRUE(amplink::IsValidUtf8(last, sizeof(last)));

  EXPECT_TRUE(amplink::IsValidUtf8(nullptr, 0));
}
