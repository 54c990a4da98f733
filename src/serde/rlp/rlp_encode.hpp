/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>

namespace taiko::rlp {

  /// Byte string item
  qtils::ByteVec encodeBytes(qtils::BytesIn bytes);

  /// Scalar item, big-endian without leading zeros, zero is the empty string
  qtils::ByteVec encodeUint(uint64_t value);

  /// List item from already encoded items
  qtils::ByteVec encodeList(const std::vector<qtils::ByteVec> &items);

}  // namespace taiko::rlp
