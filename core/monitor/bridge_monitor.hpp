/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <unordered_set>
#include <vector>

#include "alert/alert_sink.hpp"
#include "chain/chain_adapters.hpp"
#include "log/logger.hpp"
#include "registry/validator_registry.hpp"
#include "transfer/transfer_state_machine.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::monitor {

  struct ChainStats {
    size_t transfers = 0;
    primitives::Balance volume = 0;
    primitives::Balance fees = 0;
  };

  struct BridgeStats {
    size_t total_transfers = 0;
    size_t completed = 0;
    size_t refunded = 0;
    size_t expired = 0;
    size_t disputed = 0;
    size_t pending = 0;
    primitives::Balance volume = 0;
    primitives::Balance fees = 0;
    /// Share of completed transfers among all of them, 0..1
    double success_rate = 0.;
    std::chrono::seconds average_completion_time{0};
    size_t eligible_validators = 0;
    /// By source chain
    std::map<primitives::ChainId, ChainStats> chains;
  };

  struct HealthReport {
    std::map<primitives::ChainId, bool> chains;
    std::vector<primitives::TransferId> stuck_transfers;
    size_t eligible_validators = 0;
    bool paused = false;

    bool healthy() const;
  };

  /**
   * Aggregated view of the bridge for operators. Raises alerts for
   * unresponsive chains and transfers which make no progress.
   */
  class BridgeMonitor {
   public:
    struct Config {
      /// Pending transfers older than this are reported as stuck
      clock::SystemClock::Duration stuck_after = std::chrono::hours(24);
    };

    BridgeMonitor(Config config,
                  std::shared_ptr<transfer::TransferStateMachine> transfers,
                  std::shared_ptr<registry::ValidatorRegistry> registry,
                  std::shared_ptr<chain::ChainAdapters> adapters,
                  std::shared_ptr<alert::AlertSink> alert_sink,
                  std::shared_ptr<clock::SystemClock> clock);

    /// Statistics of transfers created within the window, of all if unset
    BridgeStats stats(
        std::optional<clock::SystemClock::Duration> window =
            std::nullopt) const;

    /// Checks chains and pending transfers, alerts on new problems
    HealthReport health();

   private:
    Config config_;
    std::shared_ptr<transfer::TransferStateMachine> transfers_;
    std::shared_ptr<registry::ValidatorRegistry> registry_;
    std::shared_ptr<chain::ChainAdapters> adapters_;
    std::shared_ptr<alert::AlertSink> alert_sink_;
    std::shared_ptr<clock::SystemClock> clock_;
    log::Logger logger_;

    struct Reported {
      std::set<primitives::ChainId> unresponsive;
      std::unordered_set<primitives::TransferId> stuck;
    };
    SafeObject<Reported> reported_;
  };

}  // namespace qbridge::monitor
