/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>
#include <sszpp/lists.hpp>

#include "types/block_header.hpp"
#include "types/block_metadata.hpp"
#include "types/constants.hpp"

namespace taiko {
  using ProofBlob = ssz::list<uint8_t, MAX_PROOF_SIZE>;
  using ProofBlobs = ssz::list<ProofBlob, MAX_PROOFS_PER_EVIDENCE>;
  using CircuitIds = ssz::list<uint16_t, MAX_CIRCUITS_PER_EVIDENCE>;

  /**
   * @struct Evidence
   * Proof submission for a single block.
   *
   * Proof layout for a block with N zk proofs:
   * - valid block: N zk proofs, anchor tx inclusion proof, anchor receipt
   *   inclusion proof
   * - invalid block: N zk proofs, invalidate receipt inclusion proof
   *
   * `circuits` holds one circuit id per zk proof.
   */
  struct Evidence : ssz::ssz_variable_size_container {
    BlockMetadata meta;
    BlockHeader header;
    ProverId prover;
    ProofBlobs proofs;
    CircuitIds circuits;

    SSZ_CONT(meta, header, prover, proofs, circuits);
    bool operator==(const Evidence &) const = default;
  };
}  // namespace taiko
