/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstring>

#include <qtils/byte_arr.hpp>
#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>

#include "serde/rlp/rlp_error.hpp"

/**
 * RLP decoding over byte views. Every function consumes the decoded item
 * from the front of `enc` and returns views into the original buffer.
 */
namespace taiko::rlp {

  /// Payload of the next item, which must be a string
  outcome::result<qtils::BytesIn> decodeString(qtils::BytesIn &enc);

  /// Payload of the next item, which must be a list
  outcome::result<qtils::BytesIn> decodeList(qtils::BytesIn &enc);

  /// Whole encoding of the next item, prefix included
  outcome::result<qtils::BytesIn> decodeItem(qtils::BytesIn &enc);

  /// True if the next item is a list
  bool isList(qtils::BytesIn enc);

  outcome::result<uint64_t> decodeUint(qtils::BytesIn &enc);

  /// Scalar up to 32 bytes, left padded
  outcome::result<qtils::ByteArr<32>> decodeUint256(qtils::BytesIn &enc);

  /// String of exactly N bytes
  template <size_t N>
  outcome::result<qtils::ByteArr<N>> decodeFixed(qtils::BytesIn &enc) {
    OUTCOME_TRY(payload, decodeString(enc));
    if (payload.size() != N) {
      return RlpError::ARRAY_LENGTH_UNEXPECTED;
    }
    qtils::ByteArr<N> out;
    std::memcpy(out.data(), payload.data(), N);
    return out;
  }

  /// Fails unless the whole input was consumed
  outcome::result<void> expectEnd(qtils::BytesIn enc);

}  // namespace taiko::rlp
