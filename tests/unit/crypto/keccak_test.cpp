/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/keccak.hpp"

#include <gtest/gtest.h>

#include <string_view>

using taiko::crypto::Keccak;
using taiko::crypto::keccak256;

qtils::BytesIn bytesOf(std::string_view str) {
  return {reinterpret_cast<const uint8_t *>(str.data()), str.size()};
}

TEST(KeccakTest, Empty) {
  EXPECT_EQ(
      keccak256({}).toHex(),
      "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(KeccakTest, Abc) {
  EXPECT_EQ(
      keccak256(bytesOf("abc")).toHex(),
      "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

/**
 * Input longer than the rate spans several permutations, incremental
 * update must give the same digest as one-shot hashing.
 */
TEST(KeccakTest, IncrementalMatchesOneShot) {
  std::string input(300, 'x');
  Keccak keccak;
  keccak.update(bytesOf(std::string_view(input).substr(0, 135)));
  keccak.update(bytesOf(std::string_view(input).substr(135, 2)));
  keccak.update(bytesOf(std::string_view(input).substr(137)));
  EXPECT_EQ(keccak.hash(), Keccak::hash(bytesOf(input)));
}

TEST(KeccakTest, EventSignature) {
  // topic of ERC-20 Transfer event
  EXPECT_EQ(
      keccak256(bytesOf("Transfer(address,address,uint256)")).toHex(),
      "ddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef");
}
