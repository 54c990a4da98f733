/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string>

#include <qtils/byte_vec.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/evidence.hpp"
#include "types/fork_choice.hpp"
#include "types/protocol_config.hpp"

namespace taiko::clock {
  class SystemClock;
}  // namespace taiko::clock

namespace taiko::resolver {
  class AddressResolver;
}  // namespace taiko::resolver

namespace taiko::verifier {
  class ProofVerifier;
}  // namespace taiko::verifier

namespace taiko::blockchain {
  class AnchorVerifier;
  class BlockProvenObserver;
  class ForkChoiceTable;
  class ProtocolState;
  class SubmissionValidator;

  /**
   * Admits proofs of proposed blocks into the fork choice table.
   *
   * A submission is either fully admitted, updating one fork choice and
   * emitting a `BlockProven` event, or rejected with no state change. The
   * only exception is a conflict between two proofs outside of oracle mode:
   * the protocol is halted and the submission returns success without
   * event, since the conflict can not be blamed on the submitter.
   */
  class ProvingEngine {
   public:
    enum class Error {
      HALTED,
      ORACLE_NOT_FIRST,
      ORACLE_PENDING,
      INVALID_ZK_PROOF,
      TOO_MANY_PROOFS,
      TOO_LATE,
      DUPLICATE_PROVER,
      CONFLICT_PROOF,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::HALTED:
          return "Proving is halted";
        case E::ORACLE_NOT_FIRST:
          return "Oracle prover must be the first prover";
        case E::ORACLE_PENDING:
          return "Block is not proven by the oracle prover yet";
        case E::INVALID_ZK_PROOF:
          return "Zero-knowledge proof is invalid";
        case E::TOO_MANY_PROOFS:
          return "Fork choice has maximum number of provers";
        case E::TOO_LATE:
          return "Uncle proof window is over";
        case E::DUPLICATE_PROVER:
          return "Prover already proved this fork choice";
        case E::CONFLICT_PROOF:
          return "Proof conflicts with the oracle proof";
      }
      abort();
    }

    ProvingEngine(qtils::SharedRef<log::LoggingSystem> logsys,
                  ProtocolConfig config,
                  qtils::SharedRef<clock::SystemClock> clock,
                  qtils::SharedRef<ProtocolState> state,
                  qtils::SharedRef<ForkChoiceTable> fork_choices,
                  qtils::SharedRef<SubmissionValidator> validator,
                  qtils::SharedRef<AnchorVerifier> anchor_verifier,
                  qtils::SharedRef<verifier::ProofVerifier> proof_verifier,
                  qtils::SharedRef<resolver::AddressResolver> resolver,
                  qtils::SharedRef<BlockProvenObserver> observer);

    /**
     * Prove a block was executed with the claimed header.
     * @param inputs evidence, anchor transaction and anchor receipt
     */
    outcome::result<void> proveBlock(BlockId block_id,
                                     std::span<const qtils::ByteVec> inputs);

    /**
     * Prove a block has an invalid transaction list.
     * @param inputs evidence, target metadata and invalidate receipt
     */
    outcome::result<void> proveBlockInvalid(
        BlockId block_id, std::span<const qtils::ByteVec> inputs);

    /// Accepted fork choice, if any
    const ForkChoice *getForkChoice(BlockId block_id,
                                    const BlockHash &parent_hash) const;

    bool isHalted() const;

    /// Verifier id of zk proof slot `index`
    static std::string verifierId(size_t index, uint16_t circuit);

   private:
    /**
     * Oracle gate and zk verification of `block_hash`, then fork choice
     * update recording `accepted_hash`.
     */
    outcome::result<void> admit(const Evidence &evidence,
                                const BlockMetadata &target,
                                const BlockHash &block_hash,
                                const BlockHash &accepted_hash);

    outcome::result<void> verifyZeroKnowledgeProofs(
        const Evidence &evidence, const BlockHash &block_hash) const;

    outcome::result<void> markBlockProven(const ForkChoiceKey &key,
                                          const BlockHash &block_hash,
                                          const ProverId &prover,
                                          TimestampSeconds timestamp);

    log::Logger logger_;
    ProtocolConfig config_;
    qtils::SharedRef<clock::SystemClock> clock_;
    qtils::SharedRef<ProtocolState> state_;
    qtils::SharedRef<ForkChoiceTable> fork_choices_;
    qtils::SharedRef<SubmissionValidator> validator_;
    qtils::SharedRef<AnchorVerifier> anchor_verifier_;
    qtils::SharedRef<verifier::ProofVerifier> proof_verifier_;
    qtils::SharedRef<resolver::AddressResolver> resolver_;
    qtils::SharedRef<BlockProvenObserver> observer_;
  };

}  // namespace taiko::blockchain
