/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "serde/rlp/rlp_decode.hpp"
#include "serde/rlp/rlp_encode.hpp"

using qtils::ByteVec;
using taiko::rlp::RlpError;

namespace rlp = taiko::rlp;

ByteVec hex(std::string_view str) {
  return ByteVec::fromHex(str).value();
}

qtils::BytesIn text(std::string_view str) {
  return {reinterpret_cast<const uint8_t *>(str.data()), str.size()};
}

TEST(RlpEncodeTest, Strings) {
  EXPECT_EQ(rlp::encodeBytes(text("dog")), hex("83646f67"));
  EXPECT_EQ(rlp::encodeBytes({}), hex("80"));
  EXPECT_EQ(rlp::encodeBytes(hex("0f")), hex("0f"));
  EXPECT_EQ(rlp::encodeBytes(hex("80")), hex("8180"));

  // 56 bytes take the long form
  std::string_view lorem =
      "Lorem ipsum dolor sit amet, consectetur adipisicing elit";
  auto encoded = rlp::encodeBytes(text(lorem));
  ASSERT_EQ(encoded.size(), 58);
  EXPECT_EQ(encoded[0], 0xb8);
  EXPECT_EQ(encoded[1], 56);
}

TEST(RlpEncodeTest, Integers) {
  EXPECT_EQ(rlp::encodeUint(0), hex("80"));
  EXPECT_EQ(rlp::encodeUint(15), hex("0f"));
  EXPECT_EQ(rlp::encodeUint(1024), hex("820400"));
}

TEST(RlpEncodeTest, Lists) {
  EXPECT_EQ(rlp::encodeList({}), hex("c0"));
  EXPECT_EQ(rlp::encodeList({rlp::encodeBytes(text("cat")),
                             rlp::encodeBytes(text("dog"))}),
            hex("c88363617483646f67"));
  // [ [], [[]], [ [], [[]] ] ]
  auto empty = rlp::encodeList({});
  auto nested = rlp::encodeList({empty});
  EXPECT_EQ(rlp::encodeList({empty, nested, rlp::encodeList({empty, nested})}),
            hex("c7c0c1c0c3c0c1c0"));
}

TEST(RlpDecodeTest, List) {
  auto encoded = hex("c88363617483646f67");
  qtils::BytesIn input = encoded;
  ASSERT_TRUE(rlp::isList(input));
  ASSERT_OUTCOME_SUCCESS(payload, rlp::decodeList(input));
  ASSERT_OUTCOME_SUCCESS(rlp::expectEnd(input));

  ASSERT_OUTCOME_SUCCESS(cat, rlp::decodeString(payload));
  EXPECT_EQ(ByteVec(cat.begin(), cat.end()), hex("636174"));
  ASSERT_OUTCOME_SUCCESS(item, rlp::decodeItem(payload));
  EXPECT_EQ(ByteVec(item.begin(), item.end()), hex("83646f67"));
  ASSERT_OUTCOME_SUCCESS(rlp::expectEnd(payload));
}

TEST(RlpDecodeTest, Integers) {
  auto encoded = hex("820400" "80" "0f");
  qtils::BytesIn input = encoded;
  ASSERT_OUTCOME_SUCCESS(a, rlp::decodeUint(input));
  EXPECT_EQ(a, 1024);
  ASSERT_OUTCOME_SUCCESS(b, rlp::decodeUint(input));
  EXPECT_EQ(b, 0);
  ASSERT_OUTCOME_SUCCESS(c, rlp::decodeUint(input));
  EXPECT_EQ(c, 15);
  ASSERT_OUTCOME_SUCCESS(rlp::expectEnd(input));
}

TEST(RlpDecodeTest, Malformed) {
  {
    auto encoded = hex("83646f");
    qtils::BytesIn input = encoded;
    ASSERT_OUTCOME_ERROR(rlp::decodeString(input), RlpError::INPUT_TOO_SHORT);
  }
  {
    auto encoded = hex("820004");
    qtils::BytesIn input = encoded;
    ASSERT_OUTCOME_ERROR(rlp::decodeUint(input), RlpError::LEADING_ZERO);
  }
  {
    auto encoded = hex("89010203040506070809");
    qtils::BytesIn input = encoded;
    ASSERT_OUTCOME_ERROR(rlp::decodeUint(input), RlpError::INTEGER_OVERFLOW);
  }
  {
    auto encoded = hex("c0");
    qtils::BytesIn input = encoded;
    ASSERT_OUTCOME_ERROR(rlp::decodeString(input), RlpError::TYPE_UNEXPECTED);
  }
  {
    auto encoded = hex("8401020304");
    qtils::BytesIn input = encoded;
    ASSERT_OUTCOME_ERROR(rlp::decodeFixed<3>(input),
                         RlpError::ARRAY_LENGTH_UNEXPECTED);
  }
  ASSERT_OUTCOME_ERROR(rlp::expectEnd(hex("00")), RlpError::INPUT_TOO_LONG);
}
