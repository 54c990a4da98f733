/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/impl/proof_verifier_fake.hpp"

namespace taiko::verifier {
  ProofVerifierFake::ProofVerifierFake(
      qtils::SharedRef<log::LoggingSystem> logsys)
      : logger_{logsys->getLogger("ProofVerifier", "taiko")} {}

  bool ProofVerifierFake::verifyMerkleInclusion(qtils::BytesIn,
                                                qtils::BytesIn value,
                                                qtils::BytesIn proof,
                                                const Hash256 &root) const {
    SL_TRACE(logger_,
             "Accept inclusion of {} value bytes under {:0x} ({} proof bytes)",
             value.size(),
             root,
             proof.size());
    return true;
  }

  bool ProofVerifierFake::verifyZeroKnowledgeProof(
      std::string_view verifier_id,
      qtils::BytesIn proof,
      const BlockHash &block_hash,
      const ProverId &prover,
      const TxListHash &) const {
    SL_TRACE(logger_,
             "Accept {} proof of {:0x} by {:0xx} ({} bytes)",
             verifier_id,
             block_hash,
             prover,
             proof.size());
    return true;
  }
}  // namespace taiko::verifier
