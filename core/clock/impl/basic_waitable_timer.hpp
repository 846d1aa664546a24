/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/basic_waitable_timer.hpp>
#include <boost/asio/io_context.hpp>

#include "clock/timer.hpp"

namespace qbridge::clock {

  /**
   * Timer over boost::asio::basic_waitable_timer driven by the system clock
   */
  class BasicWaitableTimer : public Timer {
   public:
    explicit BasicWaitableTimer(
        std::shared_ptr<boost::asio::io_context> io_context);

    void expiresAt(SystemClock::TimePoint at) override;

    void expiresAfter(SystemClock::Duration duration) override;

    void cancel() override;

    void asyncWait(const std::function<void(const boost::system::error_code &)>
                       &h) override;

    /// Factory producing timers bound to the given io_context
    static TimerFactory factory(
        std::shared_ptr<boost::asio::io_context> io_context);

   private:
    std::shared_ptr<boost::asio::io_context> io_context_;
    boost::asio::basic_waitable_timer<std::chrono::system_clock> timer_;
  };

}  // namespace qbridge::clock
