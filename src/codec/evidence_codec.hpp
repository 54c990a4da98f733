/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>

#include "types/block_metadata.hpp"
#include "types/evidence.hpp"

/**
 * SSZ wire format of the opaque segments of a proof submission.
 */
namespace taiko::codec {

  outcome::result<Evidence> decodeEvidence(qtils::BytesIn encoded);

  outcome::result<BlockMetadata> decodeMetadata(qtils::BytesIn encoded);

  qtils::ByteVec encodeEvidence(const Evidence &evidence);

  qtils::ByteVec encodeMetadata(const BlockMetadata &meta);

}  // namespace taiko::codec
