/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace taiko {

  // Ethereum header field sizes
  static constexpr uint64_t LOGS_BLOOM_SIZE = 256;
  static constexpr uint64_t MAX_EXTRA_DATA_SIZE = 32;

  // Evidence list limits
  static constexpr uint64_t MAX_PROOF_SIZE = 1 << 20;  // 1 MiB per blob
  static constexpr uint64_t MAX_PROOFS_PER_EVIDENCE = 16;
  static constexpr uint64_t MAX_CIRCUITS_PER_EVIDENCE = 16;

  // Segments of a proof submission:
  //  - normal: evidence, anchor tx, anchor receipt
  //  - invalidity: evidence, target metadata, invalidate receipt
  static constexpr uint64_t PROOF_INPUT_SEGMENTS = 3;

}  // namespace taiko
