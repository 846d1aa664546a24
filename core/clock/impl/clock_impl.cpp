/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/clock_impl.hpp"

namespace qbridge::clock {

  SystemClock::TimePoint SystemClockImpl::now() const {
    return std::chrono::system_clock::now();
  }

  uint64_t SystemClockImpl::nowUint64() const {
    auto since_epoch = now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
  }

}  // namespace qbridge::clock
