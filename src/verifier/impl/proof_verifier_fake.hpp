/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "verifier/proof_verifier.hpp"

namespace taiko::verifier {
  /**
   * Fake proof verifier.
   * Used for devnets and scenario replay, where no proving system runs.
   * Every proof is accepted, calls are logged at trace level.
   */
  class ProofVerifierFake : public ProofVerifier {
   public:
    explicit ProofVerifierFake(qtils::SharedRef<log::LoggingSystem> logsys);

    // ProofVerifier
    bool verifyMerkleInclusion(qtils::BytesIn key,
                               qtils::BytesIn value,
                               qtils::BytesIn proof,
                               const Hash256 &root) const override;
    bool verifyZeroKnowledgeProof(std::string_view verifier_id,
                                  qtils::BytesIn proof,
                                  const BlockHash &block_hash,
                                  const ProverId &prover,
                                  const TxListHash &tx_list_hash)
        const override;

   private:
    log::Logger logger_;
  };
}  // namespace taiko::verifier
