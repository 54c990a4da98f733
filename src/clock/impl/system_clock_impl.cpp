/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/system_clock_impl.hpp"

namespace taiko::clock {

  SystemClock::TimePoint SystemClockImpl::now() const {
    return std::chrono::system_clock::now();
  }

  uint64_t SystemClockImpl::nowSec() const {
    return sinceEpoch<std::chrono::seconds>();
  }

  uint64_t SystemClockImpl::nowMsec() const {
    return sinceEpoch<std::chrono::milliseconds>();
  }

}  // namespace taiko::clock
