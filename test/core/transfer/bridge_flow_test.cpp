/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <thread>

#include <gtest/gtest.h>

#include "alert/impl/log_alert_sink.hpp"
#include "attestation/aggregator_error.hpp"
#include "attestation/impl/attestation_aggregator_impl.hpp"
#include "chain/impl/chain_adapter_impl.hpp"
#include "chain/impl/in_memory_ledger.hpp"
#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "fee/fee_calculator.hpp"
#include "fee/impl/in_memory_price_oracle.hpp"
#include "registry/impl/default_scoring_strategy.hpp"
#include "registry/impl/validator_registry_impl.hpp"
#include "slashing/impl/slashing_engine_impl.hpp"
#include "testutil/manual_clock.hpp"
#include "testutil/manual_timer.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/validator_keys.hpp"
#include "transfer/impl/transfer_state_machine_impl.hpp"

using qbridge::alert::AlertType;
using qbridge::alert::LogAlertSink;
using qbridge::attestation::AggregatorError;
using qbridge::attestation::AttestationAggregatorImpl;
using qbridge::attestation::AttestationOutcome;
using qbridge::chain::ChainAdapterImpl;
using qbridge::chain::ChainAdapters;
using qbridge::chain::ChainConfigStore;
using qbridge::chain::InMemoryLedger;
using qbridge::crypto::Ed25519ProviderImpl;
using qbridge::fee::FeeCalculator;
using qbridge::fee::InMemoryPriceOracle;
using qbridge::primitives::AttestationPayload;
using qbridge::primitives::ChainConfig;
using qbridge::primitives::LockEvent;
using qbridge::primitives::SlashReason;
using qbridge::primitives::SlashStatus;
using qbridge::primitives::TransferStatus;
using qbridge::registry::DefaultScoringStrategy;
using qbridge::registry::ValidatorRegistryImpl;
using qbridge::replay::ReplayGuard;
using qbridge::slashing::SlashingEngineImpl;
using qbridge::transfer::DisputeResolution;
using qbridge::transfer::TransferStateMachineImpl;

/**
 * Whole bridge between two in-memory ledgers: five validators staked at
 * 10000 each, threshold 3, 1% fee
 */
class BridgeFlowTest : public testing::Test {
 public:
  static constexpr qbridge::primitives::ChainId kChainA = 1;
  static constexpr qbridge::primitives::ChainId kChainB = 2;

  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    for (auto chain_id : {kChainA, kChainB}) {
      ChainConfig config;
      config.chain_id = chain_id;
      config.min_amount = 10;
      config.max_amount = 1'000'000;
      config.fee_basis_points = 100;
      config.confirmations_required = 2;
      config.attestation_threshold = 3;
      config.validation_timeout = std::chrono::hours(24);
      config.refund_grace_period = std::chrono::hours(1);
      ASSERT_TRUE(configs->publish(config));
    }
    for (const auto &id : keys.ids()) {
      ASSERT_OUTCOME_SUCCESS_TRY(registry->registerValidator(id, 10'000));
    }

    auto make_adapter = [&](qbridge::primitives::ChainId chain_id,
                            std::shared_ptr<InMemoryLedger> ledger) {
      auto adapter = std::make_shared<ChainAdapterImpl>(
          ChainAdapterImpl::Config{
              .chain_id = chain_id,
              .retry = {.max_attempts = 2,
                        .initial_backoff = std::chrono::milliseconds(1)}},
          std::move(ledger),
          configs,
          qbridge::clock::TimerFactory{});
      adapter->subscribeLocks(transfers);
      adapters->add(adapter);
      return adapter;
    };
    adapter_a = make_adapter(kChainA, ledger_a);
    adapter_b = make_adapter(kChainB, ledger_b);

    slashing->subscribe(
        [weak{std::weak_ptr<TransferStateMachineImpl>{transfers}}](
            const qbridge::primitives::SlashEvent &event) {
          if (auto transfers = weak.lock()) {
            transfers->onSlash(event);
          }
        });
  }

  /// Locks on chain A and polls until the lock is confirmed
  LockEvent lockConfirmed(qbridge::primitives::Balance amount) {
    auto lock = ledger_a->lock(kChainB, "alice", "bob", amount);
    adapter_a->poll();
    EXPECT_EQ(status(lock), TransferStatus::Initiated);
    ledger_a->produceBlocks(1);
    adapter_a->poll();
    EXPECT_EQ(status(lock), TransferStatus::Attesting);
    return lock;
  }

  outcome::result<AttestationOutcome> attest(
      size_t validator, const AttestationPayload &payload) {
    return transfers->submitAttestation(
        keys.attest(validator, payload, clock->now()));
  }

  outcome::result<AttestationOutcome> attest(size_t validator,
                                             const LockEvent &lock) {
    return attest(validator, AttestationPayload::fromLock(lock));
  }

  TransferStatus status(const LockEvent &lock) const {
    auto transfer = transfers->get(lock.transferId());
    EXPECT_TRUE(transfer.has_value());
    return transfer ? transfer->status : TransferStatus::Initiated;
  }

  std::shared_ptr<Ed25519ProviderImpl> crypto =
      std::make_shared<Ed25519ProviderImpl>();
  testutil::ValidatorKeys keys{*crypto, 5};
  std::shared_ptr<testutil::ManualClock> clock =
      std::make_shared<testutil::ManualClock>();
  testutil::ManualTimers timers;
  std::shared_ptr<LogAlertSink> alert_sink = std::make_shared<LogAlertSink>();
  std::shared_ptr<DefaultScoringStrategy> scoring =
      std::make_shared<DefaultScoringStrategy>();
  std::shared_ptr<ValidatorRegistryImpl> registry =
      std::make_shared<ValidatorRegistryImpl>(
          ValidatorRegistryImpl::Config{.min_stake = 1'000},
          clock,
          scoring,
          alert_sink);
  std::shared_ptr<ChainConfigStore> configs =
      std::make_shared<ChainConfigStore>();
  std::shared_ptr<ChainAdapters> adapters = std::make_shared<ChainAdapters>();
  std::shared_ptr<SlashingEngineImpl> slashing =
      std::make_shared<SlashingEngineImpl>(
          SlashingEngineImpl::Config{},
          registry,
          scoring,
          crypto,
          clock,
          alert_sink,
          [adapters{adapters}](
              const LockEvent &lock) -> outcome::result<bool> {
            auto adapter = adapters->get(lock.source_chain);
            if (not adapter) {
              return false;
            }
            return adapter->verifyLock(lock);
          });
  std::shared_ptr<ReplayGuard> replay_guard = std::make_shared<ReplayGuard>();
  std::shared_ptr<AttestationAggregatorImpl> aggregator =
      std::make_shared<AttestationAggregatorImpl>(
          registry, slashing, replay_guard, crypto, clock);
  std::shared_ptr<FeeCalculator> fee_calculator =
      std::make_shared<FeeCalculator>(
          FeeCalculator::Config{},
          std::make_shared<InMemoryPriceOracle>(clock),
          clock,
          alert_sink);
  std::shared_ptr<TransferStateMachineImpl> transfers =
      std::make_shared<TransferStateMachineImpl>(
          TransferStateMachineImpl::Config{},
          configs,
          adapters,
          fee_calculator,
          aggregator,
          registry,
          slashing,
          replay_guard,
          alert_sink,
          clock,
          timers.factory());

  std::shared_ptr<InMemoryLedger> ledger_a =
      std::make_shared<InMemoryLedger>(kChainA);
  std::shared_ptr<InMemoryLedger> ledger_b =
      std::make_shared<InMemoryLedger>(kChainB);
  std::shared_ptr<ChainAdapterImpl> adapter_a;
  std::shared_ptr<ChainAdapterImpl> adapter_b;
};

/**
 * @given lock of 500 tokens from chain A to chain B
 * @when three validators attest within an hour and chain B confirms the mint
 * @then the transfer is Completed and 500 minus the fee is minted once
 */
TEST_F(BridgeFlowTest, ThreeAttestationsComplete) {
  auto lock = lockConfirmed(500);
  for (size_t i = 0; i < 3; ++i) {
    clock->advance(std::chrono::minutes(20));
    EXPECT_OUTCOME_TRUE_1(attest(i, lock));
  }
  EXPECT_EQ(status(lock), TransferStatus::Finalized);
  EXPECT_EQ(ledger_b->balanceOf("bob"), 495);

  adapter_b->poll();
  EXPECT_EQ(status(lock), TransferStatus::Finalized);
  ledger_b->produceBlocks(1);
  adapter_b->poll();
  EXPECT_EQ(status(lock), TransferStatus::Completed);

  EXPECT_OUTCOME_TRUE(late, attest(3, lock));
  EXPECT_EQ(late, AttestationOutcome::Ignored);
  EXPECT_EQ(ledger_b->mintCount(), 1);
  EXPECT_EQ(ledger_b->balanceOf("bob"), 495);
}

/**
 * @given lock with only two attestations
 * @when the 24 hour deadline passes and then the grace period
 * @then the transfer expires and the sender gets the value back
 */
TEST_F(BridgeFlowTest, TwoAttestationsExpireAndRefund) {
  auto lock = lockConfirmed(500);
  EXPECT_OUTCOME_TRUE_1(attest(0, lock));
  EXPECT_OUTCOME_TRUE_1(attest(1, lock));

  clock->advance(std::chrono::hours(24));
  timers.fireDue(clock->now());
  EXPECT_EQ(status(lock), TransferStatus::Expired);
  EXPECT_EQ(alert_sink->count(AlertType::ConsensusTimeout), 1);

  EXPECT_FALSE(transfers->refund(lock.transferId()).has_value());
  clock->advance(std::chrono::hours(1));
  EXPECT_OUTCOME_TRUE_1(transfers->refund(lock.transferId()));
  EXPECT_EQ(status(lock), TransferStatus::Refunded);
  EXPECT_EQ(ledger_a->balanceOf("alice"), 500);
  EXPECT_EQ(ledger_b->mintCount(), 0);
}

/**
 * @given validator signing two conflicting attestations for one transfer
 * @when the second one arrives
 * @then it is slashed at once, drops below eligibility and no longer counts,
 * while the transfer completes with honest attestations after revocation
 */
TEST_F(BridgeFlowTest, EquivocatorSlashedAndExcluded) {
  auto lock = lockConfirmed(500);
  auto payload = AttestationPayload::fromLock(lock);
  auto forged = payload;
  forged.recipient = "mallory";

  EXPECT_OUTCOME_TRUE_1(attest(0, payload));
  EXPECT_EC(attest(0, forged), AggregatorError::EQUIVOCATION);

  auto events = slashing->events();
  ASSERT_EQ(events.size(), 1);
  EXPECT_EQ(events[0].reason, SlashReason::Equivocation);
  EXPECT_EQ(events[0].status, SlashStatus::Applied);
  EXPECT_EQ(events[0].amount_slashed, 1'000);
  auto validator = registry->get(keys.id(0));
  EXPECT_EQ(validator->stake, 9'000);
  EXPECT_LT(validator->reputation, 50);
  EXPECT_FALSE(registry->isEligible(keys.id(0)));
  EXPECT_EQ(status(lock), TransferStatus::Disputed);

  EXPECT_OUTCOME_TRUE_1(transfers->resolveDispute(lock.transferId(),
                                                  DisputeResolution::Revoke));
  for (size_t i = 1; i <= 3; ++i) {
    EXPECT_OUTCOME_TRUE_1(attest(i, lock));
  }
  EXPECT_EQ(status(lock), TransferStatus::Finalized);

  auto next = lockConfirmed(100);
  EXPECT_EC(attest(0, next), AggregatorError::INELIGIBLE_VALIDATOR);
  EXPECT_EQ(aggregator->count(next.transferId()), 0);
}

/**
 * @given validator with a valid attestation on transfer X and a forged one
 * on transfer Y, which later equivocates on X
 * @when the accusation concerning Y is overturned
 * @then X stays disputed by the equivocation and mints only after the
 * equivocator is revoked
 */
TEST_F(BridgeFlowTest, OverturnOnOtherTransferKeepsDispute) {
  auto x = lockConfirmed(500);
  auto y = lockConfirmed(400);
  auto forged_y = AttestationPayload::fromLock(y);
  forged_y.recipient = "mallory";
  auto forged_x = AttestationPayload::fromLock(x);
  forged_x.recipient = "mallory";

  EXPECT_OUTCOME_TRUE_1(attest(0, x));
  EXPECT_EC(attest(0, forged_y), AggregatorError::PAYLOAD_MISMATCH);
  auto events = slashing->events();
  ASSERT_EQ(events.size(), 1);
  EXPECT_EQ(events[0].reason, SlashReason::InvalidAttestation);
  EXPECT_EQ(events[0].status, SlashStatus::Pending);
  EXPECT_EQ(status(x), TransferStatus::Attesting);

  EXPECT_EC(attest(0, forged_x), AggregatorError::EQUIVOCATION);
  EXPECT_EQ(status(x), TransferStatus::Disputed);
  EXPECT_OUTCOME_TRUE_1(attest(1, x));
  EXPECT_OUTCOME_TRUE_1(attest(2, x));
  EXPECT_EQ(status(x), TransferStatus::Disputed);

  EXPECT_OUTCOME_TRUE_1(slashing->overturn(events[0].id));
  EXPECT_EQ(status(x), TransferStatus::Disputed);
  EXPECT_EQ(ledger_b->mintCount(), 0);

  EXPECT_OUTCOME_TRUE_1(
      transfers->resolveDispute(x.transferId(), DisputeResolution::Revoke));
  EXPECT_OUTCOME_TRUE_1(attest(3, x));
  EXPECT_EQ(status(x), TransferStatus::Finalized);
  EXPECT_EQ(ledger_b->mintCount(), 1);
}

/**
 * @given lock observed on chain A but not yet confirmed
 * @when its block is reorganized away
 * @then the bridge forgets the transfer and nothing is refunded or minted
 */
TEST_F(BridgeFlowTest, ReorganizedLockLeavesNoTransfer) {
  auto lock = ledger_a->lock(kChainB, "alice", "bob", 500);
  adapter_a->poll();
  EXPECT_EQ(status(lock), TransferStatus::Initiated);

  ledger_a->dropLock(lock.nonce);
  ledger_a->produceBlocks(2);
  adapter_a->poll();
  EXPECT_FALSE(transfers->get(lock.transferId()).has_value());

  clock->advance(std::chrono::hours(25));
  timers.fireDue(clock->now());
  EXPECT_TRUE(transfers->list(std::nullopt, 0, 10).empty());
  EXPECT_EQ(alert_sink->count(AlertType::ConsensusTimeout), 0);
  EXPECT_EQ(ledger_b->mintCount(), 0);
}

/**
 * @given validator resending its attestation
 * @when duplicates arrive
 * @then the counted set does not grow and the threshold still needs two more
 * validators
 */
TEST_F(BridgeFlowTest, DuplicatesDoNotCount) {
  auto lock = lockConfirmed(500);
  for (int i = 0; i < 5; ++i) {
    EXPECT_OUTCOME_TRUE_1(attest(0, lock));
  }
  EXPECT_EQ(aggregator->count(lock.transferId()), 1);
  EXPECT_EQ(status(lock), TransferStatus::Attesting);

  EXPECT_OUTCOME_TRUE_1(attest(1, lock));
  EXPECT_EQ(status(lock), TransferStatus::Attesting);
  EXPECT_OUTCOME_TRUE_1(attest(2, lock));
  EXPECT_EQ(status(lock), TransferStatus::Finalized);
}

/**
 * @given validator slashed below the minimal stake
 * @when it attests
 * @then its attestation never counts toward the threshold
 */
TEST_F(BridgeFlowTest, BelowMinimalStakeNotCounted) {
  ASSERT_OUTCOME_SUCCESS_TRY(registry->slash(keys.id(4), 9'500));
  auto lock = lockConfirmed(500);

  EXPECT_EC(attest(4, lock), AggregatorError::INELIGIBLE_VALIDATOR);
  EXPECT_OUTCOME_TRUE_1(attest(0, lock));
  EXPECT_OUTCOME_TRUE_1(attest(1, lock));
  EXPECT_EQ(aggregator->count(lock.transferId()), 2);
  EXPECT_EQ(status(lock), TransferStatus::Attesting);
}

/**
 * @given every validator submitting its attestation from many threads at
 * once
 * @when the threshold is crossed concurrently
 * @then the transfer is minted exactly once
 */
TEST_F(BridgeFlowTest, ConcurrentAttestationsMintOnce) {
  auto lock = lockConfirmed(500);
  auto payload = AttestationPayload::fromLock(lock);
  std::vector<qbridge::primitives::Attestation> attestations;
  for (size_t i = 0; i < keys.size(); ++i) {
    attestations.push_back(keys.attest(i, payload, clock->now()));
  }

  std::vector<std::thread> threads;
  for (size_t t = 0; t < 8; ++t) {
    threads.emplace_back([&, t] {
      for (size_t i = 0; i < attestations.size(); ++i) {
        auto res = transfers->submitAttestation(
            attestations[(i + t) % attestations.size()]);
        EXPECT_TRUE(res.has_value());
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(status(lock), TransferStatus::Finalized);
  EXPECT_EQ(ledger_b->mintCount(), 1);
  EXPECT_EQ(ledger_b->balanceOf("bob"), 495);
}
