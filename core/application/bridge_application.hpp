/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "application/app_configuration.hpp"
#include "application/bridge_spec.hpp"
#include "application/dev_validators.hpp"
#include "chain/impl/in_memory_ledger.hpp"
#include "fee/impl/in_memory_price_oracle.hpp"
#include "governance/governance.hpp"
#include "monitor/bridge_monitor.hpp"

namespace qbridge::application {

  /**
   * Bridge node: owns every component of the engine, runs chain watch loops
   * and periodic sweeps until a shutdown signal.
   */
  class BridgeApplication
      : public std::enable_shared_from_this<BridgeApplication> {
   public:
    BridgeApplication(std::shared_ptr<AppConfiguration> app_config,
                      BridgeSpec spec);

    /// Builds the engine, publishes chain configs, registers validators
    outcome::result<void> prepare();

    /// Blocks until SIGINT or SIGTERM
    void run();

    void shutdown();

    std::shared_ptr<transfer::TransferStateMachine> transfers() const {
      return transfers_;
    }

    std::shared_ptr<governance::Governance> governance() const {
      return governance_;
    }

    std::shared_ptr<monitor::BridgeMonitor> monitor() const {
      return monitor_;
    }

   private:
    void scheduleSweep();
    void sweep();
    void scheduleDevTick();
    void devTick();

    std::shared_ptr<AppConfiguration> app_config_;
    BridgeSpec spec_;
    log::Logger logger_;

    std::shared_ptr<boost::asio::io_context> io_context_;
    boost::asio::signal_set signals_;
    clock::TimerFactory timer_factory_;
    std::unique_ptr<clock::Timer> sweep_timer_;
    std::unique_ptr<clock::Timer> dev_timer_;

    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<alert::AlertSink> alert_sink_;
    std::shared_ptr<crypto::Ed25519Provider> crypto_;
    std::shared_ptr<registry::ScoringStrategy> scoring_;
    std::shared_ptr<registry::ValidatorRegistry> registry_;
    std::shared_ptr<chain::ChainConfigStore> configs_;
    std::shared_ptr<chain::ChainAdapters> adapters_;
    std::shared_ptr<fee::InMemoryPriceOracle> price_oracle_;
    std::shared_ptr<fee::FeeCalculator> fee_calculator_;
    std::shared_ptr<slashing::SlashingEngine> slashing_;
    std::shared_ptr<replay::ReplayGuard> replay_guard_;
    std::shared_ptr<attestation::AttestationAggregator> aggregator_;
    std::shared_ptr<transfer::TransferStateMachineImpl> transfers_;
    std::shared_ptr<governance::Governance> governance_;
    std::shared_ptr<monitor::BridgeMonitor> monitor_;

    std::vector<std::shared_ptr<chain::InMemoryLedger>> ledgers_;
    std::shared_ptr<DevValidators> dev_validators_;
    size_t dev_ticks_ = 0;
  };

}  // namespace qbridge::application
