/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/anchor_verifier.hpp"

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "codec/impl/rlp_transaction_codec.hpp"
#include "crypto/impl/golden_touch_signer.hpp"
#include "mock/crypto/anchor_signer_mock.hpp"
#include "mock/resolver/address_resolver_mock.hpp"
#include "mock/verifier/proof_verifier_mock.hpp"
#include "serde/rlp/rlp_encode.hpp"
#include "testutil/evidence.hpp"
#include "testutil/prepare_loggers.hpp"

using qtils::ByteVec;
using taiko::Address;
using taiko::Evidence;
using taiko::Hash256;
using taiko::ProtocolConfig;
using taiko::blockchain::AnchorVerifier;
using taiko::codec::RlpTransactionCodec;
using taiko::crypto::AnchorSignature;
using taiko::crypto::AnchorSignerMock;
using taiko::crypto::GoldenTouchSigner;
using taiko::crypto::kGoldenTouchGX;
using taiko::crypto::kGoldenTouchGX2;
using taiko::resolver::AddressResolver;
using taiko::resolver::AddressResolverMock;
using taiko::verifier::ProofVerifierMock;
using testing::_;
using testing::Return;
using testutil::makeEvidence;
using testutil::makeMetadata;
using testutil::tagged;

namespace rlp = taiko::rlp;

using Error = AnchorVerifier::Error;

/// Legacy transaction fields that matter for the anchor checks
struct LegacyTx {
  uint64_t gas_limit = 180'000;
  Address to;
  ByteVec data;
  uint64_t v = 167 * 2 + 35;
  Hash256 r = kGoldenTouchGX;
  Hash256 s = tagged<32>(0x05, 0x05);

  ByteVec encode() const {
    return rlp::encodeList({
        rlp::encodeUint(0),
        rlp::encodeUint(0),
        rlp::encodeUint(gas_limit),
        rlp::encodeBytes(to),
        rlp::encodeUint(0),
        rlp::encodeBytes(data),
        rlp::encodeUint(v),
        rlp::encodeBytes(r),
        rlp::encodeBytes(s),
    });
  }
};

ByteVec encodeLog(const Address &address,
                  const std::vector<Hash256> &topics,
                  const ByteVec &data) {
  std::vector<ByteVec> encoded_topics;
  for (auto &topic : topics) {
    encoded_topics.push_back(rlp::encodeBytes(topic));
  }
  return rlp::encodeList({
      rlp::encodeBytes(address),
      rlp::encodeList(encoded_topics),
      rlp::encodeBytes(data),
  });
}

ByteVec encodeReceipt(bool success, const std::vector<ByteVec> &logs) {
  taiko::LogsBloom bloom;
  return rlp::encodeList({
      rlp::encodeUint(success ? 1 : 0),
      rlp::encodeUint(180'000),
      rlp::encodeBytes(bloom),
      rlp::encodeList(logs),
  });
}

class AnchorVerifierTest : public testing::Test {
 protected:
  void SetUp() override {
    taiko_address_ = tagged<20>(0x7a, 0x01);
    resolver_ = std::make_shared<AddressResolverMock>();
    EXPECT_CALL(*resolver_, resolve(167, "taiko", false))
        .WillRepeatedly(Return(taiko_address_));
    proof_verifier_ = std::make_shared<ProofVerifierMock>();
    EXPECT_CALL(*proof_verifier_, verifyMerkleInclusion(_, _, _, _))
        .WillRepeatedly(Return(true));
    signer_ = std::make_shared<GoldenTouchSigner>();
    verifier_ = makeVerifier(signer_);

    target_ = makeMetadata(5);
    evidence_ = makeEvidence(
        target_, config_, tagged<20>(0x9e, 1), tagged<32>(0xaa, 4));
    anchor_.to = taiko_address_;
    anchor_.data =
        AnchorVerifier::anchorCalldata(target_.l1_height, target_.l1_hash);
  }

  std::shared_ptr<AnchorVerifier> makeVerifier(
      std::shared_ptr<taiko::crypto::AnchorSigner> signer) {
    return std::make_shared<AnchorVerifier>(
        testutil::prepareLoggers(),
        config_,
        std::make_shared<RlpTransactionCodec>(),
        proof_verifier_,
        resolver_,
        std::move(signer));
  }

  outcome::result<void> verifyAnchor(const LegacyTx &tx, bool success = true) {
    return verifier_->verifyAnchor(
        evidence_, target_, tx.encode(), encodeReceipt(success, {}));
  }

  outcome::result<void> verifyInvalidation(const ByteVec &receipt) {
    return verifier_->verifyInvalidation(evidence_, target_, receipt);
  }

  ByteVec invalidatedLog() {
    return encodeLog(
        taiko_address_,
        {AnchorVerifier::blockInvalidatedTopic(), target_.tx_list_hash},
        {});
  }

  ProtocolConfig config_;
  Address taiko_address_;
  std::shared_ptr<AddressResolverMock> resolver_;
  std::shared_ptr<ProofVerifierMock> proof_verifier_;
  std::shared_ptr<GoldenTouchSigner> signer_;
  std::shared_ptr<AnchorVerifier> verifier_;
  taiko::BlockMetadata target_;
  Evidence evidence_;
  LegacyTx anchor_;
};

TEST(AnchorAbiTest, Selectors) {
  EXPECT_EQ(AnchorVerifier::anchorSelector().toHex(), "a0ca2d08");
  EXPECT_EQ(
      AnchorVerifier::blockInvalidatedTopic().toHex(),
      "64b299ff9f8ba674288abb53380419048a4271dda03b837ecba6b40e6ddea4a2");
  EXPECT_EQ(AnchorVerifier::firstItemKey(), ByteVec{0x80});

  auto calldata = AnchorVerifier::anchorCalldata(0x0102, Hash256{});
  ASSERT_EQ(calldata.size(), 4 + 32 + 32);
  EXPECT_EQ(calldata[4 + 30], 0x01);
  EXPECT_EQ(calldata[4 + 31], 0x02);
}

/**
 * @given anchor tx signed with k = 1 and its successful receipt
 * @then both are verified as first items of the block tries
 */
TEST_F(AnchorVerifierTest, ValidAnchor) {
  auto tx = anchor_.encode();
  auto receipt = encodeReceipt(true, {});
  EXPECT_CALL(*proof_verifier_,
              verifyMerkleInclusion(_, _, _, evidence_.header.transactions_root))
      .WillOnce(Return(true));
  EXPECT_CALL(*proof_verifier_,
              verifyMerkleInclusion(_, _, _, evidence_.header.receipts_root))
      .WillOnce(Return(true));
  ASSERT_OUTCOME_SUCCESS(
      verifier_->verifyAnchor(evidence_, target_, tx, receipt));
}

TEST_F(AnchorVerifierTest, AnchorType) {
  auto typed = rlp::encodeList({
      rlp::encodeUint(167),
      rlp::encodeUint(0),
      rlp::encodeUint(0),
      rlp::encodeUint(0),
      rlp::encodeUint(180'000),
      rlp::encodeBytes(taiko_address_),
      rlp::encodeUint(0),
      rlp::encodeBytes(anchor_.data),
      rlp::encodeList({}),
      rlp::encodeUint(0),
      rlp::encodeBytes(kGoldenTouchGX),
      rlp::encodeBytes(anchor_.s),
  });
  typed.insert(typed.begin(), 0x02);
  ASSERT_OUTCOME_ERROR(verifier_->verifyAnchor(
                           evidence_, target_, typed, encodeReceipt(true, {})),
                       Error::ANCHOR_TYPE);
}

TEST_F(AnchorVerifierTest, AnchorFields) {
  auto tx = anchor_;
  tx.to = tagged<20>(0x7a, 0x02);
  ASSERT_OUTCOME_ERROR(verifyAnchor(tx), Error::ANCHOR_DESTINATION);

  tx = anchor_;
  tx.gas_limit = 180'001;
  ASSERT_OUTCOME_ERROR(verifyAnchor(tx), Error::ANCHOR_GAS_LIMIT);

  tx = anchor_;
  tx.r = tagged<32>(0x12, 0x34);
  ASSERT_OUTCOME_ERROR(verifyAnchor(tx), Error::ANCHOR_SIGNATURE_R);

  tx = anchor_;
  tx.data = AnchorVerifier::anchorCalldata(target_.l1_height + 1,
                                           target_.l1_hash);
  ASSERT_OUTCOME_ERROR(verifyAnchor(tx), Error::ANCHOR_CALLDATA);
}

TEST_F(AnchorVerifierTest, MissingProtocolAddress) {
  EXPECT_CALL(*resolver_, resolve(167, "taiko", false))
      .WillRepeatedly(Return(AddressResolver::Error::MISSING_ADDRESS));
  ASSERT_OUTCOME_ERROR(verifyAnchor(anchor_),
                       AddressResolver::Error::MISSING_ADDRESS);
}

/**
 * @given anchor signed with k = 2
 * @then it is accepted only if k = 1 would give zero s
 */
TEST_F(AnchorVerifierTest, SecondNonce) {
  auto signer = std::make_shared<AnchorSignerMock>();
  verifier_ = makeVerifier(signer);
  auto tx = anchor_;
  tx.r = kGoldenTouchGX2;

  EXPECT_CALL(*signer, signDigest(_, 1))
      .WillOnce(Return(AnchorSignature{.r = kGoldenTouchGX, .s = {}}));
  ASSERT_OUTCOME_SUCCESS(verifyAnchor(tx));

  EXPECT_CALL(*signer, signDigest(_, 1))
      .WillOnce(Return(AnchorSignature{.r = kGoldenTouchGX, .s = anchor_.s}));
  ASSERT_OUTCOME_ERROR(verifyAnchor(tx), Error::ANCHOR_SIGNATURE_S);
}

/**
 * Real signer almost never yields zero s, so k = 2 anchors are refused
 */
TEST_F(AnchorVerifierTest, SecondNonceWithGoldenTouchKey) {
  auto tx = anchor_;
  tx.r = kGoldenTouchGX2;
  ASSERT_OUTCOME_ERROR(verifyAnchor(tx), Error::ANCHOR_SIGNATURE_S);
}

TEST_F(AnchorVerifierTest, AnchorInclusion) {
  EXPECT_CALL(*proof_verifier_,
              verifyMerkleInclusion(_, _, _, evidence_.header.transactions_root))
      .WillOnce(Return(false));
  ASSERT_OUTCOME_ERROR(verifyAnchor(anchor_), Error::ANCHOR_TX_PROOF);

  EXPECT_CALL(*proof_verifier_,
              verifyMerkleInclusion(_, _, _, evidence_.header.transactions_root))
      .WillOnce(Return(true));
  EXPECT_CALL(*proof_verifier_,
              verifyMerkleInclusion(_, _, _, evidence_.header.receipts_root))
      .WillOnce(Return(false));
  ASSERT_OUTCOME_ERROR(verifyAnchor(anchor_), Error::ANCHOR_RECEIPT_PROOF);
}

TEST_F(AnchorVerifierTest, FailedAnchor) {
  ASSERT_OUTCOME_ERROR(verifyAnchor(anchor_, false),
                       Error::ANCHOR_RECEIPT_STATUS);
}

TEST_F(AnchorVerifierTest, ValidInvalidation) {
  ASSERT_OUTCOME_SUCCESS(
      verifyInvalidation(encodeReceipt(true, {invalidatedLog()})));
}

TEST_F(AnchorVerifierTest, InvalidationReceipt) {
  EXPECT_CALL(*proof_verifier_,
              verifyMerkleInclusion(_, _, _, evidence_.header.receipts_root))
      .WillOnce(Return(false))
      .RetiresOnSaturation();
  ASSERT_OUTCOME_ERROR(
      verifyInvalidation(encodeReceipt(true, {invalidatedLog()})),
      Error::INVALIDATE_RECEIPT_PROOF);

  ASSERT_OUTCOME_ERROR(
      verifyInvalidation(encodeReceipt(false, {invalidatedLog()})),
      Error::INVALIDATE_RECEIPT_STATUS);

  ASSERT_OUTCOME_ERROR(verifyInvalidation(encodeReceipt(
                           true, {invalidatedLog(), invalidatedLog()})),
                       Error::INVALIDATE_RECEIPT_LOGS);
  ASSERT_OUTCOME_ERROR(verifyInvalidation(encodeReceipt(true, {})),
                       Error::INVALIDATE_RECEIPT_LOGS);
}

TEST_F(AnchorVerifierTest, InvalidationLog) {
  auto topic = AnchorVerifier::blockInvalidatedTopic();
  auto check = [&](const ByteVec &log, Error error) {
    ASSERT_OUTCOME_ERROR(verifyInvalidation(encodeReceipt(true, {log})),
                         error);
  };
  check(encodeLog(tagged<20>(0x7a, 0x02), {topic, target_.tx_list_hash}, {}),
        Error::INVALIDATE_RECEIPT_ADDRESS);
  check(encodeLog(taiko_address_, {topic, target_.tx_list_hash}, {0x01}),
        Error::INVALIDATE_RECEIPT_DATA);
  check(encodeLog(taiko_address_, {topic}, {}),
        Error::INVALIDATE_RECEIPT_TOPICS);
  check(encodeLog(taiko_address_, {target_.tx_list_hash, topic}, {}),
        Error::INVALIDATE_RECEIPT_TOPICS);
  check(encodeLog(taiko_address_, {topic, tagged<32>(0x00, 0x01)}, {}),
        Error::INVALIDATE_RECEIPT_TOPICS);
}
