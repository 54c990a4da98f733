/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/in_memory_protocol_state.hpp"

namespace taiko::blockchain {

  InMemoryProtocolState::InMemoryProtocolState(
      qtils::SharedRef<log::LoggingSystem> logsys, ProtocolConfig config)
      : logger_{logsys->getLogger("ProtocolState", "taiko")},
        config_{std::move(config)},
        ring_(config_.max_num_blocks) {}

  std::optional<ProposedBlock> InMemoryProtocolState::getProposedBlock(
      BlockId id) const {
    if (ring_.empty()) {
      return std::nullopt;
    }
    auto &slot = ring_[id % ring_.size()];
    if (slot.id != id or id == 0) {
      return std::nullopt;
    }
    return slot;
  }

  BlockId InMemoryProtocolState::nextBlockId() const {
    return next_block_id_;
  }

  BlockId InMemoryProtocolState::latestVerifiedId() const {
    return latest_verified_id_;
  }

  bool InMemoryProtocolState::isHalted() const {
    return halted_;
  }

  void InMemoryProtocolState::halt() {
    if (not halted_) {
      SL_CRITICAL(logger_, "Protocol halted");
    }
    halted_ = true;
  }

  outcome::result<void> InMemoryProtocolState::recordProposal(
      const BlockMetadata &meta) {
    if (halted_) {
      return Error::HALTED;
    }
    if (meta.id != next_block_id_) {
      return Error::UNEXPECTED_PROPOSAL_ID;
    }
    if (next_block_id_ - latest_verified_id_ >= ring_.size()) {
      return Error::TOO_MANY_BLOCKS;
    }
    ring_[meta.id % ring_.size()] = ProposedBlock{
        .id = meta.id,
        .meta_hash = metadataFingerprint(meta),
    };
    ++next_block_id_;
    SL_DEBUG(logger_,
             "Block #{} proposed, l1 height {}",
             meta.id,
             meta.l1_height);
    return outcome::success();
  }

  outcome::result<void> InMemoryProtocolState::markVerified(BlockId id) {
    if (id <= latest_verified_id_ or id >= next_block_id_) {
      return Error::VERIFY_OUT_OF_RANGE;
    }
    latest_verified_id_ = id;
    SL_DEBUG(logger_, "Blocks up to #{} verified", id);
    return outcome::success();
  }

}  // namespace taiko::blockchain
