/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>
#include <sszpp/lists.hpp>

#include "serde/serialization.hpp"
#include "types/constants.hpp"
#include "types/types.hpp"

namespace taiko {
  using ExtraData = ssz::list<uint8_t, MAX_EXTRA_DATA_SIZE>;

  /**
   * @struct BlockMetadata
   * Identity and commitments of a proposed L2 block. Written once by the
   * proposal flow, only read while proving.
   */
  struct BlockMetadata : ssz::ssz_variable_size_container {
    /// Monotonic id assigned at proposal time
    BlockId id = 0;
    /// L1 block the proposal is anchored to
    uint64_t l1_height = 0;
    Hash256 l1_hash;
    Address beneficiary;
    TxListHash tx_list_hash;
    Hash256 mix_hash;
    ExtraData extra_data;
    uint64_t gas_limit = 0;
    TimestampSeconds timestamp = 0;
    uint64_t commit_height = 0;
    uint64_t commit_slot = 0;

    SSZ_CONT(id,
             l1_height,
             l1_hash,
             beneficiary,
             tx_list_hash,
             mix_hash,
             extra_data,
             gas_limit,
             timestamp,
             commit_height,
             commit_slot);
    bool operator==(const BlockMetadata &) const = default;
  };

  /**
   * Fingerprint of metadata, stored by the proposal flow and compared on
   * every proof submission.
   */
  inline MetadataHash metadataFingerprint(const BlockMetadata &meta) {
    return sszHash(meta);
  }
}  // namespace taiko
