/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/bridge_application.hpp"

#include <limits>
#include <thread>

#include <boost/assert.hpp>
#include <soralog/util.hpp>

#include "alert/impl/log_alert_sink.hpp"
#include "attestation/impl/attestation_aggregator_impl.hpp"
#include "clock/impl/basic_waitable_timer.hpp"
#include "clock/impl/clock_impl.hpp"
#include "crypto/ed25519/ed25519_provider_impl.hpp"

namespace qbridge::application {

  namespace {
    constexpr size_t kDevValidators = 5;
    constexpr primitives::Balance kDevStake = 10'000;
    /// Demo lock is made every this many dev ticks
    constexpr size_t kDevLockPeriod = 10;
  }  // namespace

  BridgeApplication::BridgeApplication(
      std::shared_ptr<AppConfiguration> app_config, BridgeSpec spec)
      : app_config_{std::move(app_config)},
        spec_{std::move(spec)},
        logger_{log::createLogger("BridgeApplication", "application")},
        io_context_{std::make_shared<boost::asio::io_context>()},
        signals_{*io_context_, SIGINT, SIGTERM},
        timer_factory_{clock::BasicWaitableTimer::factory(io_context_)} {
    BOOST_ASSERT(app_config_);
  }

  outcome::result<void> BridgeApplication::prepare() {
    clock_ = std::make_shared<clock::SystemClockImpl>();
    alert_sink_ = std::make_shared<alert::LogAlertSink>();
    crypto_ = std::make_shared<crypto::Ed25519ProviderImpl>();
    scoring_ =
        std::make_shared<registry::DefaultScoringStrategy>(spec_.scoring);
    registry_ = std::make_shared<registry::ValidatorRegistryImpl>(
        spec_.registry, clock_, scoring_, alert_sink_);

    configs_ = std::make_shared<chain::ChainConfigStore>();
    for (const auto &chain : spec_.chains) {
      OUTCOME_TRY(configs_->publish(chain));
    }
    adapters_ = std::make_shared<chain::ChainAdapters>();

    price_oracle_ = std::make_shared<fee::InMemoryPriceOracle>(clock_);
    for (const auto &[pair, price] : spec_.prices) {
      price_oracle_->setPrice(pair, price);
    }
    fee_calculator_ = std::make_shared<fee::FeeCalculator>(
        spec_.fee, price_oracle_, clock_, alert_sink_);

    slashing_ = std::make_shared<slashing::SlashingEngineImpl>(
        spec_.slashing,
        registry_,
        scoring_,
        crypto_,
        clock_,
        alert_sink_,
        [adapters{adapters_}](
            const primitives::LockEvent &lock) -> outcome::result<bool> {
          auto adapter = adapters->get(lock.source_chain);
          if (not adapter) {
            return false;
          }
          return adapter->verifyLock(lock);
        });
    replay_guard_ = std::make_shared<replay::ReplayGuard>();
    aggregator_ = std::make_shared<attestation::AttestationAggregatorImpl>(
        registry_, slashing_, replay_guard_, crypto_, clock_);
    transfers_ = std::make_shared<transfer::TransferStateMachineImpl>(
        spec_.transfer,
        configs_,
        adapters_,
        fee_calculator_,
        aggregator_,
        registry_,
        slashing_,
        replay_guard_,
        alert_sink_,
        clock_,
        timer_factory_);
    slashing_->subscribe(
        [weak{std::weak_ptr<transfer::TransferStateMachine>{transfers_}}](
            const primitives::SlashEvent &event) {
          if (auto transfers = weak.lock()) {
            transfers->onSlash(event);
          }
        });

    if (app_config_->isDevMode()) {
      dev_validators_ = std::make_shared<DevValidators>(
          kDevValidators, crypto_, clock_, transfers_);
    }

    for (const auto &chain : spec_.chains) {
      auto ledger = std::make_shared<chain::InMemoryLedger>(chain.chain_id);
      auto adapter = std::make_shared<chain::ChainAdapterImpl>(
          chain::ChainAdapterImpl::Config{
              .chain_id = chain.chain_id,
              .start_block = 0,
              .poll_interval = app_config_->pollInterval(),
              .retry = spec_.submission},
          ledger,
          configs_,
          timer_factory_);
      adapter->subscribeLocks(transfers_);
      if (dev_validators_) {
        adapter->subscribeLocks(dev_validators_);
      }
      adapters_->add(adapter);
      ledgers_.push_back(std::move(ledger));
    }

    if (not spec_.governance.members.empty()) {
      governance_ = std::make_shared<governance::GovernanceImpl>(
          spec_.governance, registry_, configs_, transfers_, crypto_, clock_);
    } else {
      SL_WARN(logger_, "No governance members, privileged calls are disabled");
    }

    monitor_ = std::make_shared<monitor::BridgeMonitor>(
        spec_.monitor, transfers_, registry_, adapters_, alert_sink_, clock_);

    for (const auto &validator : spec_.validators) {
      OUTCOME_TRY(registry_->registerValidator(validator.id, validator.stake));
    }
    if (dev_validators_) {
      auto stake = std::max(kDevStake, spec_.registry.min_stake);
      for (const auto &keypair : dev_validators_->keypairs()) {
        OUTCOME_TRY(registry_->registerValidator(keypair.public_key, stake));
      }
    }

    SL_INFO(logger_,
            "Bridge prepared: {} chains, {} eligible validators",
            spec_.chains.size(),
            registry_->eligibleCount());
    return outcome::success();
  }

  void BridgeApplication::run() {
    BOOST_ASSERT_MSG(transfers_, "prepare() must succeed before run()");

    signals_.async_wait([weak{weak_from_this()}](
                            const boost::system::error_code &ec, int signal) {
      if (ec) {
        return;
      }
      if (auto self = weak.lock()) {
        SL_INFO(self->logger_, "Shutdown signal {} received", signal);
        self->shutdown();
      }
    });

    // transfers which were due while the node was down
    sweep();
    for (const auto &adapter : adapters_->all()) {
      adapter->start();
    }
    scheduleSweep();
    if (dev_validators_) {
      scheduleDevTick();
    }

    std::vector<std::thread> workers;
    for (size_t i = 1; i < app_config_->threads(); ++i) {
      workers.emplace_back([io{io_context_}, i] {
        soralog::util::setThreadName(fmt::format("worker.{}", i));
        io->run();
      });
    }
    io_context_->run();
    for (auto &worker : workers) {
      worker.join();
    }
  }

  void BridgeApplication::shutdown() {
    for (const auto &adapter : adapters_->all()) {
      adapter->stop();
    }
    if (sweep_timer_) {
      sweep_timer_->cancel();
    }
    if (dev_timer_) {
      dev_timer_->cancel();
    }
    io_context_->stop();
  }

  void BridgeApplication::scheduleSweep() {
    sweep_timer_ = timer_factory_();
    sweep_timer_->expiresAfter(app_config_->sweepInterval());
    sweep_timer_->asyncWait(
        [weak{weak_from_this()}](const boost::system::error_code &ec) {
          if (ec) {
            return;
          }
          if (auto self = weak.lock()) {
            self->sweep();
            self->scheduleSweep();
          }
        });
  }

  void BridgeApplication::sweep() {
    auto expired = transfers_->expireOverdue();
    auto unresolved = transfers_->reportUnresolvedDisputes();
    auto applied = slashing_->finalizeMatured();
    registry_->applyInactivityDecay();
    auto pruned = transfers_->pruneSettled();
    auto health = monitor_->health();
    SL_VERBOSE(logger_,
               "Sweep: {} expired, {} unresolved disputes, {} slashes applied, "
               "{} settled pruned, {} eligible validators",
               expired.size(),
               unresolved,
               applied.size(),
               pruned,
               health.eligible_validators);

    for (const auto &transfer :
         transfers_->list(primitives::TransferStatus::Expired,
                          0,
                          std::numeric_limits<size_t>::max())) {
      if (transfer.refund_available_at
          and *transfer.refund_available_at <= clock_->now()
          and not transfer.requires_operator) {
        if (auto res = transfers_->refund(transfer.id); res.has_error()) {
          SL_WARN(logger_,
                  "Refund of {} not submitted: {}",
                  transfer.id,
                  res.error().message());
        }
      }
    }
  }

  void BridgeApplication::scheduleDevTick() {
    dev_timer_ = timer_factory_();
    dev_timer_->expiresAfter(app_config_->pollInterval());
    dev_timer_->asyncWait(
        [weak{weak_from_this()}](const boost::system::error_code &ec) {
          if (ec) {
            return;
          }
          if (auto self = weak.lock()) {
            self->devTick();
            self->scheduleDevTick();
          }
        });
  }

  void BridgeApplication::devTick() {
    for (const auto &ledger : ledgers_) {
      ledger->produceBlocks(1);
    }
    // dev prices never move, they are only kept fresh
    price_oracle_->refresh();
    if (ledgers_.size() < 2 or dev_ticks_++ % kDevLockPeriod != 0) {
      return;
    }
    const auto &source = spec_.chains.front();
    const auto &dest = spec_.chains.back();
    auto amount = std::max<primitives::Balance>(source.min_amount, 500);
    auto lock = ledgers_.front()->lock(
        dest.chain_id, "dev-alice", "dev-bob", amount);
    SL_INFO(logger_,
            "Dev lock #{} of {} from chain #{} to chain #{}",
            lock.nonce,
            lock.amount,
            lock.source_chain,
            lock.dest_chain);
  }

}  // namespace qbridge::application
