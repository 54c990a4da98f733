/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/evidence.hpp"
#include "types/protocol_config.hpp"
#include "types/transaction.hpp"

namespace taiko::codec {
  class TransactionCodec;
}  // namespace taiko::codec

namespace taiko::crypto {
  class AnchorSigner;
}  // namespace taiko::crypto

namespace taiko::resolver {
  class AddressResolver;
}  // namespace taiko::resolver

namespace taiko::verifier {
  class ProofVerifier;
}  // namespace taiko::verifier

namespace taiko::blockchain {

  /**
   * Checks of the first transaction of a block and its receipt.
   *
   * A valid block starts with the anchor transaction, which binds it to an
   * L1 block. An invalid block starts with a transaction whose receipt
   * carries a single `BlockInvalidated(txListHash)` log.
   */
  class AnchorVerifier {
   public:
    enum class Error {
      ANCHOR_TYPE,
      ANCHOR_DESTINATION,
      ANCHOR_GAS_LIMIT,
      ANCHOR_SIGNATURE_R,
      ANCHOR_SIGNATURE_S,
      ANCHOR_CALLDATA,
      ANCHOR_TX_PROOF,
      ANCHOR_RECEIPT_STATUS,
      ANCHOR_RECEIPT_PROOF,
      INVALIDATE_RECEIPT_PROOF,
      INVALIDATE_RECEIPT_STATUS,
      INVALIDATE_RECEIPT_LOGS,
      INVALIDATE_RECEIPT_ADDRESS,
      INVALIDATE_RECEIPT_DATA,
      INVALIDATE_RECEIPT_TOPICS,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::ANCHOR_TYPE:
          return "Anchor transaction is not a legacy transaction";
        case E::ANCHOR_DESTINATION:
          return "Anchor transaction is not sent to the protocol contract";
        case E::ANCHOR_GAS_LIMIT:
          return "Anchor transaction has unexpected gas limit";
        case E::ANCHOR_SIGNATURE_R:
          return "Anchor transaction is not signed by the golden touch key";
        case E::ANCHOR_SIGNATURE_S:
          return "Anchor transaction signature can not be reproduced";
        case E::ANCHOR_CALLDATA:
          return "Anchor transaction has unexpected calldata";
        case E::ANCHOR_TX_PROOF:
          return "Anchor transaction is not the first transaction";
        case E::ANCHOR_RECEIPT_STATUS:
          return "Anchor transaction failed";
        case E::ANCHOR_RECEIPT_PROOF:
          return "Anchor receipt is not the first receipt";
        case E::INVALIDATE_RECEIPT_PROOF:
          return "Invalidate receipt is not the first receipt";
        case E::INVALIDATE_RECEIPT_STATUS:
          return "Invalidate transaction failed";
        case E::INVALIDATE_RECEIPT_LOGS:
          return "Invalidate receipt must have exactly one log";
        case E::INVALIDATE_RECEIPT_ADDRESS:
          return "Invalidate log is not emitted by the protocol contract";
        case E::INVALIDATE_RECEIPT_DATA:
          return "Invalidate log must have empty data";
        case E::INVALIDATE_RECEIPT_TOPICS:
          return "Invalidate log has unexpected topics";
      }
      abort();
    }

    AnchorVerifier(qtils::SharedRef<log::LoggingSystem> logsys,
                   ProtocolConfig config,
                   qtils::SharedRef<codec::TransactionCodec> codec,
                   qtils::SharedRef<verifier::ProofVerifier> proof_verifier,
                   qtils::SharedRef<resolver::AddressResolver> resolver,
                   qtils::SharedRef<crypto::AnchorSigner> signer);

    /**
     * Anchor transaction and its receipt are the first ones of the block.
     * Inclusion proofs follow the zk proofs in `evidence.proofs`.
     */
    outcome::result<void> verifyAnchor(const Evidence &evidence,
                                       const BlockMetadata &target,
                                       qtils::BytesIn anchor_tx,
                                       qtils::BytesIn anchor_receipt) const;

    /**
     * Invalidate receipt is the first one of the block and reports the
     * target's transaction list.
     */
    outcome::result<void> verifyInvalidation(
        const Evidence &evidence,
        const BlockMetadata &target,
        qtils::BytesIn invalidate_receipt) const;

    /// `anchor(uint256,bytes32)` selector
    static qtils::ByteArr<4> anchorSelector();

    /// Calldata of the anchor transaction for an L1 block
    static qtils::ByteVec anchorCalldata(uint64_t l1_height,
                                         const Hash256 &l1_hash);

    /// `BlockInvalidated(bytes32)` event signature
    static Hash256 blockInvalidatedTopic();

    /// Trie key of the first transaction or receipt, `rlp(0)`
    static qtils::ByteVec firstItemKey();

   private:
    outcome::result<void> verifySignature(const Transaction &tx) const;

    log::Logger logger_;
    ProtocolConfig config_;
    qtils::SharedRef<codec::TransactionCodec> codec_;
    qtils::SharedRef<verifier::ProofVerifier> proof_verifier_;
    qtils::SharedRef<resolver::AddressResolver> resolver_;
    qtils::SharedRef<crypto::AnchorSigner> signer_;
  };

}  // namespace taiko::blockchain
