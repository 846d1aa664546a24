/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace qbridge::clock {

  /**
   * Source of the current time
   * @tparam ClockType underlying clock, such as std::chrono::system_clock
   */
  template <typename ClockType>
  class Clock {
   public:
    using Duration = typename ClockType::duration;
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;

    /**
     * @return seconds since the beginning of epoch
     */
    virtual uint64_t nowUint64() const = 0;

    static TimePoint zero() {
      return TimePoint{};
    }
  };

  /// Wall clock. Deadlines, dispute windows and cooldowns are measured by it
  using SystemClock = Clock<std::chrono::system_clock>;

  using TimePoint = SystemClock::TimePoint;

}  // namespace qbridge::clock
