/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/block_proven.hpp"

namespace taiko::blockchain {

  /**
   * Receives an event for every admitted proof.
   */
  class BlockProvenObserver {
   public:
    virtual ~BlockProvenObserver() = default;

    virtual void onBlockProven(const BlockProven &event) = 0;
  };

}  // namespace taiko::blockchain
