/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/evidence_codec.hpp"

#include "serde/serialization.hpp"

namespace taiko::codec {

  outcome::result<Evidence> decodeEvidence(qtils::BytesIn encoded) {
    return decode<Evidence>(encoded);
  }

  outcome::result<BlockMetadata> decodeMetadata(qtils::BytesIn encoded) {
    return decode<BlockMetadata>(encoded);
  }

  qtils::ByteVec encodeEvidence(const Evidence &evidence) {
    return encode(evidence);
  }

  qtils::ByteVec encodeMetadata(const BlockMetadata &meta) {
    return encode(meta);
  }

}  // namespace taiko::codec
