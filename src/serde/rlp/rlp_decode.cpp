/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/rlp/rlp_decode.hpp"

namespace taiko::rlp {

  namespace {
    struct ItemHeader {
      bool is_list;
      size_t prefix_size;
      size_t payload_size;
    };

    outcome::result<uint64_t> decodeBigEndian(qtils::BytesIn bytes) {
      if (bytes.size() > sizeof(uint64_t)) {
        return RlpError::INTEGER_OVERFLOW;
      }
      if (not bytes.empty() and bytes[0] == 0) {
        return RlpError::LEADING_ZERO;
      }
      uint64_t value = 0;
      for (auto byte : bytes) {
        value = (value << 8) | byte;
      }
      return value;
    }

    outcome::result<ItemHeader> parseHeader(qtils::BytesIn enc) {
      if (enc.empty()) {
        return RlpError::INPUT_TOO_SHORT;
      }
      auto prefix = enc[0];
      ItemHeader header{};
      if (prefix < 0x80) {
        header = {false, 0, 1};
      } else if (prefix < 0xb8) {
        header = {false, 1, static_cast<size_t>(prefix - 0x80)};
      } else if (prefix < 0xc0) {
        size_t length_of_length = prefix - 0xb7;
        if (1 + length_of_length > enc.size()) {
          return RlpError::INPUT_TOO_SHORT;
        }
        OUTCOME_TRY(length,
                    decodeBigEndian(enc.subspan(1, length_of_length)));
        header = {false, 1 + length_of_length, length};
      } else if (prefix < 0xf8) {
        header = {true, 1, static_cast<size_t>(prefix - 0xc0)};
      } else {
        size_t length_of_length = prefix - 0xf7;
        if (1 + length_of_length > enc.size()) {
          return RlpError::INPUT_TOO_SHORT;
        }
        OUTCOME_TRY(length,
                    decodeBigEndian(enc.subspan(1, length_of_length)));
        header = {true, 1 + length_of_length, length};
      }
      if (header.payload_size > enc.size() - header.prefix_size) {
        return RlpError::INPUT_TOO_SHORT;
      }
      return header;
    }
  }  // namespace

  outcome::result<qtils::BytesIn> decodeString(qtils::BytesIn &enc) {
    OUTCOME_TRY(header, parseHeader(enc));
    if (header.is_list) {
      return RlpError::TYPE_UNEXPECTED;
    }
    auto payload = enc.subspan(header.prefix_size, header.payload_size);
    enc = enc.subspan(header.prefix_size + header.payload_size);
    return payload;
  }

  outcome::result<qtils::BytesIn> decodeList(qtils::BytesIn &enc) {
    OUTCOME_TRY(header, parseHeader(enc));
    if (not header.is_list) {
      return RlpError::TYPE_UNEXPECTED;
    }
    auto payload = enc.subspan(header.prefix_size, header.payload_size);
    enc = enc.subspan(header.prefix_size + header.payload_size);
    return payload;
  }

  outcome::result<qtils::BytesIn> decodeItem(qtils::BytesIn &enc) {
    OUTCOME_TRY(header, parseHeader(enc));
    auto size = header.prefix_size + header.payload_size;
    auto item = enc.first(size);
    enc = enc.subspan(size);
    return item;
  }

  bool isList(qtils::BytesIn enc) {
    return not enc.empty() and enc[0] >= 0xc0;
  }

  outcome::result<uint64_t> decodeUint(qtils::BytesIn &enc) {
    OUTCOME_TRY(payload, decodeString(enc));
    return decodeBigEndian(payload);
  }

  outcome::result<qtils::ByteArr<32>> decodeUint256(qtils::BytesIn &enc) {
    OUTCOME_TRY(payload, decodeString(enc));
    if (payload.size() > 32) {
      return RlpError::INTEGER_OVERFLOW;
    }
    if (not payload.empty() and payload[0] == 0) {
      return RlpError::LEADING_ZERO;
    }
    qtils::ByteArr<32> out;
    std::memcpy(out.data() + (32 - payload.size()),
                payload.data(),
                payload.size());
    return out;
  }

  outcome::result<void> expectEnd(qtils::BytesIn enc) {
    if (not enc.empty()) {
      return RlpError::INPUT_TOO_LONG;
    }
    return outcome::success();
  }

}  // namespace taiko::rlp
