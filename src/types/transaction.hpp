/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include <qtils/byte_vec.hpp>

#include "types/types.hpp"

namespace taiko {

  enum class TransactionType : uint8_t {
    LEGACY = 0,
    ACCESS_LIST = 1,  // EIP-2930
    DYNAMIC_FEE = 2,  // EIP-1559
  };

  /**
   * @struct Transaction
   * Decoded L2 transaction, only the fields the proving protocol looks at.
   */
  struct Transaction {
    TransactionType type = TransactionType::LEGACY;
    /// Zero for a legacy transaction signed without replay protection
    ChainId chain_id = 0;
    uint64_t nonce = 0;
    uint64_t gas_limit = 0;
    /// Empty for contract creation
    std::optional<Address> destination;
    /// Big-endian, leading zeros stripped
    qtils::ByteVec amount;
    qtils::ByteVec data;
    uint64_t v = 0;
    Hash256 r;
    Hash256 s;
    /// RLP items preceding the signature, as they were encoded
    std::vector<qtils::ByteVec> unsigned_fields;
  };

}  // namespace taiko
