/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>

namespace taiko {
  using BlockHash = qtils::ByteArr<32>;

  constexpr BlockHash kZeroHash;

  /**
   * Hash recorded for a block proven invalid, its fork choice can never be
   * extended by a real execution result.
   */
  inline const BlockHash kBlockDeadendHash = [] {
    BlockHash hash;
    hash[hash.size() - 1] = 1;
    return hash;
  }();
}  // namespace taiko
