/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/in_memory_protocol_state.hpp"

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "testutil/evidence.hpp"
#include "testutil/prepare_loggers.hpp"

using taiko::ProtocolConfig;
using taiko::metadataFingerprint;
using taiko::blockchain::InMemoryProtocolState;
using testutil::makeMetadata;

using Error = InMemoryProtocolState::Error;

InMemoryProtocolState makeState(uint64_t max_num_blocks) {
  return InMemoryProtocolState(testutil::prepareLoggers(),
                               ProtocolConfig{.max_num_blocks = max_num_blocks});
}

TEST(InMemoryProtocolStateTest, Genesis) {
  auto state = makeState(8);
  EXPECT_EQ(state.nextBlockId(), 1);
  EXPECT_EQ(state.latestVerifiedId(), 0);
  EXPECT_FALSE(state.isHalted());
  EXPECT_FALSE(state.getProposedBlock(0).has_value());
  EXPECT_FALSE(state.getProposedBlock(1).has_value());
}

TEST(InMemoryProtocolStateTest, RecordProposal) {
  auto state = makeState(8);
  auto meta = makeMetadata(1);
  ASSERT_OUTCOME_SUCCESS(state.recordProposal(meta));
  EXPECT_EQ(state.nextBlockId(), 2);
  auto proposed = state.getProposedBlock(1);
  ASSERT_TRUE(proposed.has_value());
  EXPECT_EQ(proposed->id, 1);
  EXPECT_EQ(proposed->meta_hash, metadataFingerprint(meta));

  ASSERT_OUTCOME_ERROR(state.recordProposal(makeMetadata(1)),
                       Error::UNEXPECTED_PROPOSAL_ID);
  ASSERT_OUTCOME_ERROR(state.recordProposal(makeMetadata(3)),
                       Error::UNEXPECTED_PROPOSAL_ID);
}

/**
 * @given ring of 4 slots
 * @when 3 blocks are unverified
 * @then next proposal is refused until a block is verified, then it reuses
 * the slot of the verified block
 */
TEST(InMemoryProtocolStateTest, RingIsBoundedByVerification) {
  auto state = makeState(4);
  for (taiko::BlockId id = 1; id <= 3; ++id) {
    ASSERT_OUTCOME_SUCCESS(state.recordProposal(makeMetadata(id)));
  }
  ASSERT_OUTCOME_ERROR(state.recordProposal(makeMetadata(4)),
                       Error::TOO_MANY_BLOCKS);

  ASSERT_OUTCOME_SUCCESS(state.markVerified(1));
  ASSERT_OUTCOME_SUCCESS(state.recordProposal(makeMetadata(4)));
  ASSERT_OUTCOME_SUCCESS(state.markVerified(2));
  ASSERT_OUTCOME_SUCCESS(state.recordProposal(makeMetadata(5)));

  // slot 1 now holds block 5
  EXPECT_FALSE(state.getProposedBlock(1).has_value());
  ASSERT_TRUE(state.getProposedBlock(5).has_value());
  EXPECT_EQ(state.getProposedBlock(5)->meta_hash,
            metadataFingerprint(makeMetadata(5)));
}

TEST(InMemoryProtocolStateTest, MarkVerifiedRange) {
  auto state = makeState(8);
  ASSERT_OUTCOME_ERROR(state.markVerified(1), Error::VERIFY_OUT_OF_RANGE);
  ASSERT_OUTCOME_SUCCESS(state.recordProposal(makeMetadata(1)));
  ASSERT_OUTCOME_SUCCESS(state.recordProposal(makeMetadata(2)));
  ASSERT_OUTCOME_SUCCESS(state.markVerified(2));
  EXPECT_EQ(state.latestVerifiedId(), 2);
  ASSERT_OUTCOME_ERROR(state.markVerified(1), Error::VERIFY_OUT_OF_RANGE);
  ASSERT_OUTCOME_ERROR(state.markVerified(2), Error::VERIFY_OUT_OF_RANGE);
}

TEST(InMemoryProtocolStateTest, HaltStopsProposals) {
  auto state = makeState(8);
  state.halt();
  EXPECT_TRUE(state.isHalted());
  ASSERT_OUTCOME_ERROR(state.recordProposal(makeMetadata(1)), Error::HALTED);
}
