/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/rlp/rlp_encode.hpp"

namespace taiko::rlp {

  namespace {
    constexpr uint8_t kStringOffset = 0x80;
    constexpr uint8_t kListOffset = 0xc0;
    constexpr size_t kShortLength = 55;

    qtils::ByteVec bigEndian(uint64_t value) {
      qtils::ByteVec out;
      while (value != 0) {
        out.insert(out.begin(), static_cast<uint8_t>(value & 0xff));
        value >>= 8;
      }
      return out;
    }

    void appendPrefix(qtils::ByteVec &out, size_t length, uint8_t offset) {
      if (length <= kShortLength) {
        out.push_back(static_cast<uint8_t>(offset + length));
        return;
      }
      auto length_bytes = bigEndian(length);
      out.push_back(
          static_cast<uint8_t>(offset + kShortLength + length_bytes.size()));
      out.insert(out.end(), length_bytes.begin(), length_bytes.end());
    }
  }  // namespace

  qtils::ByteVec encodeBytes(qtils::BytesIn bytes) {
    qtils::ByteVec out;
    if (bytes.size() == 1 and bytes[0] < kStringOffset) {
      out.push_back(bytes[0]);
      return out;
    }
    appendPrefix(out, bytes.size(), kStringOffset);
    out.insert(out.end(), bytes.begin(), bytes.end());
    return out;
  }

  qtils::ByteVec encodeUint(uint64_t value) {
    return encodeBytes(bigEndian(value));
  }

  qtils::ByteVec encodeList(const std::vector<qtils::ByteVec> &items) {
    size_t length = 0;
    for (auto &item : items) {
      length += item.size();
    }
    qtils::ByteVec out;
    out.reserve(length + 9);
    appendPrefix(out, length, kListOffset);
    for (auto &item : items) {
      out.insert(out.end(), item.begin(), item.end());
    }
    return out;
  }

}  // namespace taiko::rlp
