/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/anchor_verifier.hpp"

#include <algorithm>

#include <boost/endian/conversion.hpp>

#include "codec/transaction_codec.hpp"
#include "crypto/anchor_signer.hpp"
#include "crypto/keccak.hpp"
#include "resolver/address_resolver.hpp"
#include "serde/rlp/rlp_encode.hpp"
#include "verifier/proof_verifier.hpp"

namespace taiko::blockchain {

  namespace {
    qtils::BytesIn asBytes(std::string_view str) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const uint8_t *>(str.data()), str.size()};
    }
  }  // namespace

  AnchorVerifier::AnchorVerifier(
      qtils::SharedRef<log::LoggingSystem> logsys,
      ProtocolConfig config,
      qtils::SharedRef<codec::TransactionCodec> codec,
      qtils::SharedRef<verifier::ProofVerifier> proof_verifier,
      qtils::SharedRef<resolver::AddressResolver> resolver,
      qtils::SharedRef<crypto::AnchorSigner> signer)
      : logger_{logsys->getLogger("AnchorVerifier", "taiko")},
        config_{std::move(config)},
        codec_{std::move(codec)},
        proof_verifier_{std::move(proof_verifier)},
        resolver_{std::move(resolver)},
        signer_{std::move(signer)} {}

  qtils::ByteArr<4> AnchorVerifier::anchorSelector() {
    auto hash = crypto::keccak256(asBytes("anchor(uint256,bytes32)"));
    qtils::ByteArr<4> selector;
    std::copy_n(hash.begin(), selector.size(), selector.begin());
    return selector;
  }

  qtils::ByteVec AnchorVerifier::anchorCalldata(uint64_t l1_height,
                                                const Hash256 &l1_hash) {
    // abi.encodeWithSelector(anchor, uint256(l1_height), l1_hash)
    Hash256 height;
    boost::endian::store_big_u64(height.data() + height.size() - 8,
                                 l1_height);
    auto selector = anchorSelector();
    qtils::ByteVec calldata;
    calldata.insert(calldata.end(), selector.begin(), selector.end());
    calldata.insert(calldata.end(), height.begin(), height.end());
    calldata.insert(calldata.end(), l1_hash.begin(), l1_hash.end());
    return calldata;
  }

  Hash256 AnchorVerifier::blockInvalidatedTopic() {
    return crypto::keccak256(asBytes("BlockInvalidated(bytes32)"));
  }

  qtils::ByteVec AnchorVerifier::firstItemKey() {
    return rlp::encodeUint(0);
  }

  outcome::result<void> AnchorVerifier::verifyAnchor(
      const Evidence &evidence,
      const BlockMetadata &target,
      qtils::BytesIn anchor_tx,
      qtils::BytesIn anchor_receipt) const {
    OUTCOME_TRY(tx, codec_->decodeTransaction(config_.chain_id, anchor_tx));
    if (tx.type != TransactionType::LEGACY) {
      return Error::ANCHOR_TYPE;
    }
    OUTCOME_TRY(taiko_address,
                resolver_->resolve(
                    config_.chain_id, resolver::kTaikoName, false));
    if (tx.destination != taiko_address) {
      return Error::ANCHOR_DESTINATION;
    }
    if (tx.gas_limit != config_.anchor_tx_gas_limit) {
      return Error::ANCHOR_GAS_LIMIT;
    }
    OUTCOME_TRY(verifySignature(tx));
    if (tx.data != anchorCalldata(target.l1_height, target.l1_hash)) {
      return Error::ANCHOR_CALLDATA;
    }

    auto zk = config_.zk_proofs_per_block;
    auto key = firstItemKey();
    if (not proof_verifier_->verifyMerkleInclusion(
            key,
            anchor_tx,
            evidence.proofs.data()[zk].data(),
            evidence.header.transactions_root)) {
      return Error::ANCHOR_TX_PROOF;
    }

    OUTCOME_TRY(receipt, codec_->decodeReceipt(anchor_receipt));
    if (receipt.status != TxStatus::SUCCESS) {
      return Error::ANCHOR_RECEIPT_STATUS;
    }
    if (not proof_verifier_->verifyMerkleInclusion(
            key,
            anchor_receipt,
            evidence.proofs.data()[zk + 1].data(),
            evidence.header.receipts_root)) {
      return Error::ANCHOR_RECEIPT_PROOF;
    }
    SL_TRACE(logger_,
             "Anchor of block #{} to l1 block {} verified",
             target.id,
             target.l1_height);
    return outcome::success();
  }

  outcome::result<void> AnchorVerifier::verifySignature(
      const Transaction &tx) const {
    if (tx.r == crypto::kGoldenTouchGX) {
      return outcome::success();
    }
    if (tx.r != crypto::kGoldenTouchGX2) {
      return Error::ANCHOR_SIGNATURE_R;
    }
    // Signed with k = 2 only when k = 1 gives s = 0
    auto digest = codec_->unsignedTransactionHash(config_.chain_id, tx);
    OUTCOME_TRY(signature, signer_->signDigest(digest, 1));
    if (signature.s != Hash256{}) {
      return Error::ANCHOR_SIGNATURE_S;
    }
    return outcome::success();
  }

  outcome::result<void> AnchorVerifier::verifyInvalidation(
      const Evidence &evidence,
      const BlockMetadata &target,
      qtils::BytesIn invalidate_receipt) const {
    auto zk = config_.zk_proofs_per_block;
    if (not proof_verifier_->verifyMerkleInclusion(
            firstItemKey(),
            invalidate_receipt,
            evidence.proofs.data()[zk].data(),
            evidence.header.receipts_root)) {
      return Error::INVALIDATE_RECEIPT_PROOF;
    }

    OUTCOME_TRY(receipt, codec_->decodeReceipt(invalidate_receipt));
    if (receipt.status != TxStatus::SUCCESS) {
      return Error::INVALIDATE_RECEIPT_STATUS;
    }
    if (receipt.logs.size() != 1) {
      return Error::INVALIDATE_RECEIPT_LOGS;
    }
    auto &event_log = receipt.logs.front();
    OUTCOME_TRY(taiko_address,
                resolver_->resolve(
                    config_.chain_id, resolver::kTaikoName, false));
    if (event_log.address != taiko_address) {
      return Error::INVALIDATE_RECEIPT_ADDRESS;
    }
    if (not event_log.data.empty()) {
      return Error::INVALIDATE_RECEIPT_DATA;
    }
    if (event_log.topics.size() != 2
        or event_log.topics[0] != blockInvalidatedTopic()
        or event_log.topics[1] != target.tx_list_hash) {
      return Error::INVALIDATE_RECEIPT_TOPICS;
    }
    SL_TRACE(logger_, "Invalidation of block #{} verified", target.id);
    return outcome::success();
  }

}  // namespace taiko::blockchain
