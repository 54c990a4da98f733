/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/rlp/block_header_rlp.hpp"

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "serde/rlp/rlp_decode.hpp"

using taiko::BlockHeader;
using taiko::Hash256;

namespace rlp = taiko::rlp;

template <typename T>
T fromHex(std::string_view hex) {
  return T::fromHex(hex).value();
}

/// Ethereum mainnet genesis header
BlockHeader mainnetGenesis() {
  BlockHeader header;
  header.ommers_hash = fromHex<Hash256>(
      "1dcc4de8dec75d7aab85b567b6ccd41ad312451b948a7413f0a142fd40d49347");
  header.state_root = fromHex<Hash256>(
      "d7f8974fb5ac78d9ac099b9ad5018bedc2ce0a72dad1827a1709da30580f0544");
  header.transactions_root = fromHex<Hash256>(
      "56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421");
  header.receipts_root = header.transactions_root;
  header.difficulty = 17179869184;
  header.gas_limit = 5000;
  auto extra = fromHex<qtils::ByteVec>(
      "11bbe8db4e347b4e8c937c1c8370e4b5ed33adb3db69cbdb7a38e1e50b1b82fa");
  header.extra_data.data().assign(extra.begin(), extra.end());
  header.nonce = 0x42;
  return header;
}

TEST(BlockHeaderRlpTest, MainnetGenesisHash) {
  EXPECT_EQ(
      rlp::hashBlockHeader(mainnetGenesis()).toHex(),
      "d4e56740f876aef8c010b86a40d5f56745a118d0906a34e69aec8c0db1cb8fa3");
}

size_t countItems(qtils::BytesIn encoded) {
  auto list = rlp::decodeList(encoded).value();
  size_t count = 0;
  while (not list.empty()) {
    EXPECT_OUTCOME_SUCCESS(rlp::decodeItem(list));
    ++count;
  }
  return count;
}

/**
 * @given header without and with base fee
 * @when encoding
 * @then base fee is appended as 16th item only when not zero
 */
TEST(BlockHeaderRlpTest, BaseFeeIsOptional) {
  auto header = mainnetGenesis();
  auto legacy = rlp::encodeBlockHeader(header);
  EXPECT_EQ(countItems(legacy), 15);

  header.base_fee_per_gas = 1'000'000'000;
  auto london = rlp::encodeBlockHeader(header);
  EXPECT_EQ(countItems(london), 16);
  EXPECT_NE(rlp::hashBlockHeader(header), rlp::hashBlockHeader(mainnetGenesis()));
}

TEST(BlockHeaderRlpTest, HashCoversParent) {
  auto header = mainnetGenesis();
  auto hash = rlp::hashBlockHeader(header);
  header.parent_hash[0] = 1;
  EXPECT_NE(rlp::hashBlockHeader(header), hash);
}
