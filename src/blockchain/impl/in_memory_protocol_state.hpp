/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "blockchain/protocol_state.hpp"
#include "log/logger.hpp"
#include "types/block_metadata.hpp"
#include "types/protocol_config.hpp"

namespace taiko::blockchain {

  /**
   * Protocol state kept in memory. Proposals live in a ring of
   * `max_num_blocks` slots addressed by `id % max_num_blocks`, so a slot is
   * reused only after the block occupying it got verified.
   */
  class InMemoryProtocolState : public ProtocolState {
   public:
    enum class Error {
      UNEXPECTED_PROPOSAL_ID,
      TOO_MANY_BLOCKS,
      VERIFY_OUT_OF_RANGE,
      HALTED,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::UNEXPECTED_PROPOSAL_ID:
          return "Proposed block id is not the next block id";
        case E::TOO_MANY_BLOCKS:
          return "Too many unverified blocks";
        case E::VERIFY_OUT_OF_RANGE:
          return "Block is not proposed or already verified";
        case E::HALTED:
          return "Protocol is halted";
      }
      abort();
    }

    InMemoryProtocolState(qtils::SharedRef<log::LoggingSystem> logsys,
                          ProtocolConfig config);

    // ProtocolState
    std::optional<ProposedBlock> getProposedBlock(BlockId id) const override;
    BlockId nextBlockId() const override;
    BlockId latestVerifiedId() const override;
    bool isHalted() const override;
    void halt() override;

    /**
     * Store fingerprint of proposed metadata, `meta.id` must be the next
     * block id.
     */
    outcome::result<void> recordProposal(const BlockMetadata &meta);

    /**
     * Advance latest verified id up to `id`
     */
    outcome::result<void> markVerified(BlockId id);

   private:
    log::Logger logger_;
    ProtocolConfig config_;
    std::vector<ProposedBlock> ring_;
    // Block 0 is genesis, verified from the start
    BlockId next_block_id_ = 1;
    BlockId latest_verified_id_ = 0;
    bool halted_ = false;
  };

}  // namespace taiko::blockchain
