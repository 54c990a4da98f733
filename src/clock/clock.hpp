/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace taiko::clock {

  /**
   * An interface for a clock
   * @tparam clock type is an underlying clock type, such as std::system_clock
   */
  template <typename ClockType>
  class Clock {
   public:
    using Duration = typename ClockType::duration;

    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    /**
     * @return a time point representing the current time
     */
    [[nodiscard]] virtual TimePoint now() const = 0;

    /**
     * @return number of seconds since the beginning of epoch (Jan 1, 1970),
     * the unit of fork choice timestamps
     */
    [[nodiscard]] virtual uint64_t nowSec() const = 0;

    /**
     * @return number of milliseconds since the beginning of epoch
     */
    [[nodiscard]] virtual uint64_t nowMsec() const = 0;
  };

  /**
   * Wall clock, proofs are timestamped with it
   */
  class SystemClock : public Clock<std::chrono::system_clock> {};

}  // namespace taiko::clock
