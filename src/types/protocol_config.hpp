/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "types/types.hpp"

namespace taiko {

  /**
   * Parameters of the proving protocol, identical for every node of a
   * network.
   */
  struct ProtocolConfig {
    /// L2 chain, namespace of L2 contract addresses
    ChainId chain_id = 167;
    /// L1 chain, namespace of L1 service addresses
    ChainId l1_chain_id = 31336;
    /// Size of the proposed blocks ring
    uint64_t max_num_blocks = 2049;
    uint64_t zk_proofs_per_block = 1;
    uint64_t max_proofs_per_fork_choice = 5;
    uint64_t anchor_tx_gas_limit = 180'000;
    /// Seconds after the first proof during which uncle proofs are accepted
    uint64_t uncle_proof_window = 3600;
    bool enable_oracle_prover = false;
    bool enable_anchor_validation = true;
    /// Maximum number of fork choices tracked, zero means unbounded
    uint64_t fork_choice_capacity = 0;

    bool operator==(const ProtocolConfig &) const = default;
  };

}  // namespace taiko
