/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace taiko::clock {

  /// Wall clock of the host
  class SystemClockImpl final : public SystemClock {
   public:
    TimePoint now() const override;
    uint64_t nowSec() const override;
    uint64_t nowMsec() const override;

   private:
    template <typename Unit>
    uint64_t sinceEpoch() const {
      return std::chrono::duration_cast<Unit>(now().time_since_epoch())
          .count();
    }
  };

}  // namespace taiko::clock
