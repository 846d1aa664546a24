/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alert/impl/log_alert_sink.hpp"

namespace qbridge::alert {

  LogAlertSink::LogAlertSink()
      : logger_{log::createLogger("AlertSink", "alert")} {}

  void LogAlertSink::raise(Alert alert) {
    counters_.exclusiveAccess([&](auto &counters) { ++counters[alert.type]; });

    if (alert.transfer_id.has_value()) {
      SL_WARN(logger_,
              "ALERT {}: {} (transfer {}, amount {})",
              alert.type,
              alert.description,
              alert.transfer_id.value(),
              alert.amount);
      return;
    }
    SL_WARN(logger_, "ALERT {}: {}", alert.type, alert.description);
  }

  size_t LogAlertSink::count(AlertType type) const {
    return counters_.sharedAccess([&](const auto &counters) -> size_t {
      auto it = counters.find(type);
      return it == counters.end() ? 0 : it->second;
    });
  }

}  // namespace qbridge::alert
