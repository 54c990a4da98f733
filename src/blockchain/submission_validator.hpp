/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>

#include <qtils/byte_vec.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "blockchain/protocol_state.hpp"
#include "types/evidence.hpp"
#include "types/protocol_config.hpp"

namespace taiko::blockchain {

  /**
   * Decoded proof submission. For a valid block proof `target` is the
   * evidence metadata, for an invalidity proof it is supplied separately.
   */
  struct ProofSubmission {
    Evidence evidence;
    BlockMetadata target;
  };

  /**
   * Structural checks of a proof submission, done before any cryptographic
   * work: segment and proof counts, block id range, metadata fingerprint
   * and header consistency.
   */
  class SubmissionValidator {
   public:
    enum class Error {
      INPUT_SIZE,
      ID_MISMATCH,
      TARGET_ID_MISMATCH,
      PROOF_COUNT,
      CIRCUIT_COUNT,
      ID_OUT_OF_RANGE,
      METADATA_MISMATCH,
      ZERO_PROVER,
      HEADER_MISMATCH,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::INPUT_SIZE:
          return "Unexpected number of input segments";
        case E::ID_MISMATCH:
          return "Evidence is for another block";
        case E::TARGET_ID_MISMATCH:
          return "Evidence and target are for different blocks";
        case E::PROOF_COUNT:
          return "Unexpected number of proofs";
        case E::CIRCUIT_COUNT:
          return "Unexpected number of circuits";
        case E::ID_OUT_OF_RANGE:
          return "Block is not proposed or already verified";
        case E::METADATA_MISMATCH:
          return "Metadata does not match the proposed block";
        case E::ZERO_PROVER:
          return "Prover is zero address";
        case E::HEADER_MISMATCH:
          return "Header does not match the block metadata";
      }
      abort();
    }

    SubmissionValidator(ProtocolConfig config,
                        qtils::SharedRef<ProtocolState> state);

    /**
     * Checks `[evidence, anchor tx, anchor receipt]` of a valid block proof.
     * @return decoded submission, target is the evidence metadata
     */
    outcome::result<ProofSubmission> validateProof(
        BlockId block_id, std::span<const qtils::ByteVec> inputs) const;

    /**
     * Checks `[evidence, target metadata, invalidate receipt]` of an
     * invalidity proof.
     */
    outcome::result<ProofSubmission> validateInvalidityProof(
        BlockId block_id, std::span<const qtils::ByteVec> inputs) const;

    /// Proposed, unverified, and fingerprint matches the stored one
    outcome::result<void> checkTarget(const BlockMetadata &target) const;

    outcome::result<void> checkHeader(const BlockHeader &header,
                                      const BlockMetadata &target) const;

   private:
    outcome::result<void> checkProofCounts(const Evidence &evidence,
                                           size_t inclusion_proofs) const;

    ProtocolConfig config_;
    qtils::SharedRef<ProtocolState> state_;
  };

}  // namespace taiko::blockchain
