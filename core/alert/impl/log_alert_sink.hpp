/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <unordered_map>

#include "alert/alert_sink.hpp"
#include "log/logger.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::alert {

  /**
   * Writes alerts into the log and keeps a per-type count of them
   */
  class LogAlertSink : public AlertSink {
   public:
    LogAlertSink();

    void raise(Alert alert) override;

    size_t count(AlertType type) const;

   private:
    log::Logger logger_;
    SafeObject<std::unordered_map<AlertType, size_t>> counters_;
  };

}  // namespace qbridge::alert
