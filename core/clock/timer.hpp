/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>

#include <boost/system/error_code.hpp>

#include "clock/clock.hpp"

namespace qbridge::clock {

  /**
   * Interface for asynchronous one-shot timer
   */
  struct Timer {
    virtual ~Timer() = default;

    virtual void expiresAt(SystemClock::TimePoint at) = 0;

    virtual void expiresAfter(SystemClock::Duration duration) = 0;

    /// Pending handler is invoked with operation_aborted
    virtual void cancel() = 0;

    virtual void asyncWait(
        const std::function<void(const boost::system::error_code &)> &h) = 0;
  };

  using TimerFactory = std::function<std::unique_ptr<Timer>()>;

}  // namespace qbridge::clock
