/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/bytes.hpp>

#include "types/types.hpp"

namespace taiko::verifier {

  /**
   * Checks the cryptographic parts of a proof submission.
   */
  class ProofVerifier {
   public:
    virtual ~ProofVerifier() = default;

    /**
     * Merkle Patricia trie inclusion.
     * @param key encoded trie key
     * @param value encoded leaf value
     * @param proof encoded trie nodes from root to leaf
     * @param root expected trie root
     */
    virtual bool verifyMerkleInclusion(qtils::BytesIn key,
                                       qtils::BytesIn value,
                                       qtils::BytesIn proof,
                                       const Hash256 &root) const = 0;

    /**
     * Zero-knowledge proof of block execution.
     * @param verifier_id selects verifying key, see `verifierId`
     */
    virtual bool verifyZeroKnowledgeProof(std::string_view verifier_id,
                                          qtils::BytesIn proof,
                                          const BlockHash &block_hash,
                                          const ProverId &prover,
                                          const TxListHash &tx_list_hash)
        const = 0;
  };

}  // namespace taiko::verifier
