/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cinttypes>

#include <qtils/byte_arr.hpp>
#include <qtils/byte_vec.hpp>

#include "types/address.hpp"
#include "types/block_hash.hpp"

namespace taiko {
  using BlockId = uint64_t;
  using ChainId = uint64_t;
  using TimestampSeconds = uint64_t;

  using Hash256 = qtils::ByteArr<32>;
  using TxListHash = Hash256;
  using MetadataHash = Hash256;

  /// Identity of a prover, an L1 account
  using ProverId = Address;
}  // namespace taiko
