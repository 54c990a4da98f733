/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/block_proven_journal.hpp"

namespace taiko::blockchain {

  BlockProvenJournal::BlockProvenJournal(
      qtils::SharedRef<log::LoggingSystem> logsys)
      : logger_{logsys->getLogger("BlockProven", "taiko")} {}

  void BlockProvenJournal::onBlockProven(const BlockProven &event) {
    SL_INFO(logger_, "{}", event);
    events_.push_back(event);
  }

}  // namespace taiko::blockchain
