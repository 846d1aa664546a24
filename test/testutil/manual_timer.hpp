/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <boost/asio/error.hpp>

#include "clock/timer.hpp"

namespace testutil {

  /**
   * Timer fired by the test. Every timer made by the factory is kept, so the
   * test can fire all of them whose deadline has come.
   */
  class ManualTimer : public qbridge::clock::Timer {
   public:
    using Handler = std::function<void(const boost::system::error_code &)>;

    void expiresAt(qbridge::clock::SystemClock::TimePoint at) override {
      deadline = at;
    }

    void expiresAfter(qbridge::clock::SystemClock::Duration duration) override {
      after = duration;
    }

    void cancel() override {
      if (auto h = std::exchange(handler, std::nullopt)) {
        (*h)(boost::asio::error::operation_aborted);
      }
    }

    void asyncWait(const Handler &h) override {
      handler = h;
    }

    void fire() {
      if (auto h = std::exchange(handler, std::nullopt)) {
        (*h)({});
      }
    }

    bool pending() const {
      return handler.has_value();
    }

    std::optional<qbridge::clock::SystemClock::TimePoint> deadline;
    std::optional<qbridge::clock::SystemClock::Duration> after;
    std::optional<Handler> handler;
  };

  /// Timer factory handing out ManualTimer proxies
  class ManualTimers {
   public:
    qbridge::clock::TimerFactory factory() {
      return [this] {
        auto timer = std::make_shared<ManualTimer>();
        timers_.push_back(timer);
        return std::make_unique<Proxy>(timer);
      };
    }

    /// Fires every pending timer whose deadline is not in the future
    void fireDue(qbridge::clock::SystemClock::TimePoint now) {
      auto timers = timers_;
      for (const auto &timer : timers) {
        if (timer->pending() and timer->deadline and *timer->deadline <= now) {
          timer->fire();
        }
      }
    }

    const std::vector<std::shared_ptr<ManualTimer>> &timers() const {
      return timers_;
    }

   private:
    struct Proxy : qbridge::clock::Timer {
      explicit Proxy(std::shared_ptr<ManualTimer> timer)
          : timer{std::move(timer)} {}

      void expiresAt(qbridge::clock::SystemClock::TimePoint at) override {
        timer->expiresAt(at);
      }

      void expiresAfter(
          qbridge::clock::SystemClock::Duration duration) override {
        timer->expiresAfter(duration);
      }

      void cancel() override {
        timer->cancel();
      }

      void asyncWait(const ManualTimer::Handler &h) override {
        timer->asyncWait(h);
      }

      std::shared_ptr<ManualTimer> timer;
    };

    std::vector<std::shared_ptr<ManualTimer>> timers_;
  };

}  // namespace testutil
