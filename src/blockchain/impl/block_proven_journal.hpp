/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/shared_ref.hpp>

#include "blockchain/block_proven_observer.hpp"
#include "log/logger.hpp"

namespace taiko::blockchain {

  /**
   * Logs and keeps every event in order of emission.
   */
  class BlockProvenJournal : public BlockProvenObserver {
   public:
    explicit BlockProvenJournal(qtils::SharedRef<log::LoggingSystem> logsys);

    // BlockProvenObserver
    void onBlockProven(const BlockProven &event) override;

    const std::vector<BlockProven> &events() const {
      return events_;
    }

   private:
    log::Logger logger_;
    std::vector<BlockProven> events_;
  };

}  // namespace taiko::blockchain
