/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/block_metadata.hpp"
#include "types/constants.hpp"
#include "types/types.hpp"

namespace taiko {
  using LogsBloom = qtils::ByteArr<LOGS_BLOOM_SIZE>;

  /**
   * @struct BlockHeader
   * Ethereum-shaped L2 header claimed by a prover. Never stored, only checked
   * against the block metadata and hashed.
   */
  struct BlockHeader : ssz::ssz_variable_size_container {
    BlockHash parent_hash;
    Hash256 ommers_hash;
    Address beneficiary;
    Hash256 state_root;
    Hash256 transactions_root;
    Hash256 receipts_root;
    LogsBloom logs_bloom;
    uint64_t difficulty = 0;
    uint64_t height = 0;
    uint64_t gas_limit = 0;
    uint64_t gas_used = 0;
    TimestampSeconds timestamp = 0;
    ExtraData extra_data;
    Hash256 mix_hash;
    uint64_t nonce = 0;
    uint64_t base_fee_per_gas = 0;

    SSZ_CONT(parent_hash,
             ommers_hash,
             beneficiary,
             state_root,
             transactions_root,
             receipts_root,
             logs_bloom,
             difficulty,
             height,
             gas_limit,
             gas_used,
             timestamp,
             extra_data,
             mix_hash,
             nonce,
             base_fee_per_gas);
    bool operator==(const BlockHeader &) const = default;
  };
}  // namespace taiko
