/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace qbridge::clock {

  /// Wall clock of the host
  class SystemClockImpl : public SystemClock {
   public:
    TimePoint now() const override;

    uint64_t nowUint64() const override;
  };

}  // namespace qbridge::clock
