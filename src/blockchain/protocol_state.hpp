/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "types/types.hpp"

namespace taiko::blockchain {

  /**
   * Record kept by the proposal flow for every proposed block.
   */
  struct ProposedBlock {
    BlockId id = 0;
    MetadataHash meta_hash;

    bool operator==(const ProposedBlock &) const = default;
  };

  /**
   * Global state shared with the proposal and verification flows. The
   * proving flow only reads it, except for the halt flag.
   */
  class ProtocolState {
   public:
    virtual ~ProtocolState() = default;

    /// Proposal record of `id`, none if it is not in the proposal window
    virtual std::optional<ProposedBlock> getProposedBlock(BlockId id) const = 0;

    /// Id the next proposal will get
    virtual BlockId nextBlockId() const = 0;

    virtual BlockId latestVerifiedId() const = 0;

    virtual bool isHalted() const = 0;

    /// One-way, nothing can be proven afterwards
    virtual void halt() = 0;
  };

}  // namespace taiko::blockchain
