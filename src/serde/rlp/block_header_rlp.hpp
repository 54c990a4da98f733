/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>

#include "types/block_header.hpp"

namespace taiko::rlp {

  /**
   * Ethereum header encoding. `base_fee_per_gas` is appended only when it is
   * not zero, so pre-London headers keep their historical hash.
   */
  qtils::ByteVec encodeBlockHeader(const BlockHeader &header);

  /// keccak256 of the header encoding
  BlockHash hashBlockHeader(const BlockHeader &header);

}  // namespace taiko::rlp
