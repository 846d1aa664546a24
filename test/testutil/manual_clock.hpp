/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>

#include "clock/clock.hpp"

namespace testutil {

  /**
   * Wall clock which moves only when told to
   */
  class ManualClock : public qbridge::clock::SystemClock {
   public:
    explicit ManualClock(TimePoint start = TimePoint{std::chrono::hours(1000)})
        : now_{start} {}

    TimePoint now() const override {
      return now_.load();
    }

    uint64_t nowUint64() const override {
      return std::chrono::duration_cast<std::chrono::seconds>(
                 now().time_since_epoch())
          .count();
    }

    void set(TimePoint at) {
      now_ = at;
    }

    void advance(Duration duration) {
      now_ = now_.load() + duration;
    }

   private:
    std::atomic<TimePoint> now_;
  };

}  // namespace testutil
