/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "slashing/impl/slashing_engine_impl.hpp"

#include <gtest/gtest.h>

#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "mock/core/alert/alert_sink_mock.hpp"
#include "registry/impl/default_scoring_strategy.hpp"
#include "registry/impl/validator_registry_impl.hpp"
#include "slashing/slashing_error.hpp"
#include "testutil/manual_clock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/validator_keys.hpp"

using qbridge::alert::AlertSinkMock;
using qbridge::alert::AlertType;
using qbridge::crypto::Ed25519ProviderImpl;
using qbridge::primitives::AttestationPayload;
using qbridge::primitives::LockEvent;
using qbridge::primitives::SlashEvent;
using qbridge::primitives::SlashReason;
using qbridge::primitives::SlashStatus;
using qbridge::primitives::TransferId;
using qbridge::registry::DefaultScoringStrategy;
using qbridge::registry::ValidatorRegistryImpl;
using qbridge::slashing::SlashingEngineImpl;
using qbridge::slashing::SlashingError;
using testing::_;
using testing::AnyNumber;
using testing::Field;
using testing::NiceMock;

class SlashingEngineTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    for (const auto &id : keys.ids()) {
      ASSERT_OUTCOME_SUCCESS_TRY(registry->registerValidator(id, 10'000));
    }
    engine->subscribe(
        [this](const SlashEvent &event) { notified.push_back(event); });
  }

  static LockEvent lockEvent(uint64_t nonce) {
    return LockEvent{.source_chain = 1,
                     .dest_chain = 2,
                     .nonce = nonce,
                     .sender = "alice",
                     .recipient = "bob",
                     .amount = 500,
                     .block_number = nonce};
  }

  std::shared_ptr<Ed25519ProviderImpl> crypto =
      std::make_shared<Ed25519ProviderImpl>();
  testutil::ValidatorKeys keys{*crypto, 5};
  std::shared_ptr<testutil::ManualClock> clock =
      std::make_shared<testutil::ManualClock>();
  std::shared_ptr<NiceMock<AlertSinkMock>> alert_sink =
      std::make_shared<NiceMock<AlertSinkMock>>();
  std::shared_ptr<DefaultScoringStrategy> scoring =
      std::make_shared<DefaultScoringStrategy>();
  std::shared_ptr<ValidatorRegistryImpl> registry =
      std::make_shared<ValidatorRegistryImpl>(
          ValidatorRegistryImpl::Config{.min_stake = 1'000},
          clock,
          scoring,
          alert_sink);

  /// Locks which really happened on the source ledger
  std::vector<LockEvent> ledger_locks{lockEvent(1)};

  std::shared_ptr<SlashingEngineImpl> engine =
      std::make_shared<SlashingEngineImpl>(
          SlashingEngineImpl::Config{.dispute_window = std::chrono::hours(48),
                                     .missed_window_limit = 5},
          registry,
          scoring,
          crypto,
          clock,
          alert_sink,
          [this](const LockEvent &lock) -> outcome::result<bool> {
            return std::ranges::find(ledger_locks, lock) != ledger_locks.end();
          });

  std::vector<SlashEvent> notified;
};

/**
 * @given validator signing two different payloads for one transfer
 * @when the equivocation is reported
 * @then 10% of the stake is taken at once, the validator loses eligibility
 * and alerts are raised
 */
TEST_F(SlashingEngineTest, EquivocationSlashedImmediately) {
  auto payload = AttestationPayload::fromLock(lockEvent(1));
  auto forged = payload;
  forged.amount = 5'000;
  auto first = keys.attest(0, payload);
  auto second = keys.attest(0, forged);

  EXPECT_CALL(*alert_sink, raise(_)).Times(AnyNumber());
  EXPECT_CALL(*alert_sink,
              raise(Field(&qbridge::alert::Alert::type,
                          AlertType::Equivocation)))
      .Times(1);
  EXPECT_CALL(*alert_sink,
              raise(Field(&qbridge::alert::Alert::type,
                          AlertType::SlashApplied)))
      .Times(1);

  EXPECT_OUTCOME_TRUE(event, engine->reportEquivocation(first, second));
  EXPECT_EQ(event.status, SlashStatus::Applied);
  EXPECT_EQ(event.reason, SlashReason::Equivocation);
  EXPECT_EQ(event.amount_slashed, 1'000);
  EXPECT_EQ(event.transfer_id, payload.transfer_id);

  auto validator = registry->get(keys.id(0));
  ASSERT_TRUE(validator.has_value());
  EXPECT_EQ(validator->stake, 9'000);
  EXPECT_EQ(validator->reputation, 20);
  EXPECT_FALSE(registry->isEligible(keys.id(0)));

  ASSERT_EQ(notified.size(), 1);
  EXPECT_EQ(notified[0].id, event.id);

  EXPECT_EC(engine->reportEquivocation(second, first),
            SlashingError::ALREADY_REPORTED);
  EXPECT_EQ(registry->get(keys.id(0))->stake, 9'000);
}

/**
 * @given pairs of attestations which do not prove equivocation
 * @when they are reported
 * @then they are refused and nobody is slashed
 */
TEST_F(SlashingEngineTest, NonEquivocationRefused) {
  auto payload = AttestationPayload::fromLock(lockEvent(1));
  auto forged = payload;
  forged.recipient = "mallory";

  EXPECT_EC(engine->reportEquivocation(keys.attest(0, payload),
                                       keys.attest(0, payload)),
            SlashingError::NOT_EQUIVOCATION);
  EXPECT_EC(engine->reportEquivocation(keys.attest(0, payload),
                                       keys.attest(1, forged)),
            SlashingError::NOT_EQUIVOCATION);

  auto unsigned_forgery = keys.attest(0, payload);
  unsigned_forgery.payload = forged;
  EXPECT_EC(engine->reportEquivocation(keys.attest(0, payload),
                                       unsigned_forgery),
            SlashingError::INVALID_SIGNATURE);

  EXPECT_TRUE(engine->events().empty());
  EXPECT_EQ(registry->get(keys.id(0))->stake, 10'000);
}

/**
 * @given attestation describing a lock which never happened
 * @when it is reported
 * @then the slash waits for 48 hours and then takes the stake
 */
TEST_F(SlashingEngineTest, InvalidAttestationAppliedAfterDisputeWindow) {
  auto phantom = AttestationPayload::fromLock(lockEvent(7));
  auto accused = keys.attest(1, phantom);

  EXPECT_OUTCOME_TRUE(event, engine->reportInvalidAttestation(accused));
  EXPECT_EQ(event.status, SlashStatus::Pending);
  EXPECT_EQ(event.amount_slashed, 0);
  EXPECT_EQ(event.dispute_deadline, clock->now() + std::chrono::hours(48));
  EXPECT_EQ(registry->get(keys.id(1))->stake, 10'000);
  EXPECT_TRUE(registry->isEligible(keys.id(1)));

  EXPECT_EC(engine->reportInvalidAttestation(accused),
            SlashingError::ALREADY_REPORTED);

  clock->advance(std::chrono::hours(47));
  EXPECT_TRUE(engine->finalizeMatured().empty());

  clock->advance(std::chrono::hours(1));
  auto applied = engine->finalizeMatured();
  ASSERT_EQ(applied.size(), 1);
  EXPECT_EQ(applied[0].status, SlashStatus::Applied);
  EXPECT_EQ(applied[0].amount_slashed, 1'000);
  EXPECT_EQ(engine->get(event.id)->status, SlashStatus::Applied);

  auto validator = registry->get(keys.id(1));
  EXPECT_EQ(validator->stake, 9'000);
  EXPECT_EQ(validator->reputation, 40);
  EXPECT_FALSE(registry->isEligible(keys.id(1)));

  EXPECT_TRUE(engine->finalizeMatured().empty());
  EXPECT_EQ(notified.size(), 2);
}

/**
 * @given pending accusation of an attestation for a lock which did happen
 * @when the lock is submitted as counter-evidence
 * @then the slash is overturned and never applied
 */
TEST_F(SlashingEngineTest, LockRefutesInvalidAttestation) {
  auto accused = keys.attest(2, AttestationPayload::fromLock(lockEvent(1)));
  EXPECT_OUTCOME_TRUE(event, engine->reportInvalidAttestation(accused));

  clock->advance(std::chrono::hours(12));
  EXPECT_OUTCOME_TRUE(refuted,
                      engine->submitCounterEvidence(event.id, lockEvent(1)));
  EXPECT_EQ(refuted.status, SlashStatus::Overturned);

  clock->advance(std::chrono::hours(48));
  EXPECT_TRUE(engine->finalizeMatured().empty());
  EXPECT_EQ(registry->get(keys.id(2))->stake, 10'000);

  EXPECT_EC(engine->submitCounterEvidence(event.id, lockEvent(1)),
            SlashingError::NOT_PENDING);
}

/**
 * @given pending accusation
 * @when unconvincing or late counter-evidence is submitted
 * @then it is rejected and the slash stays pending
 */
TEST_F(SlashingEngineTest, CounterEvidenceRejected) {
  auto accused = keys.attest(2, AttestationPayload::fromLock(lockEvent(7)));
  EXPECT_OUTCOME_TRUE(event, engine->reportInvalidAttestation(accused));

  // matches the attestation, but the ledger never saw it
  EXPECT_EC(engine->submitCounterEvidence(event.id, lockEvent(7)),
            SlashingError::EVIDENCE_REJECTED);
  // real lock, but not the one attested
  EXPECT_EC(engine->submitCounterEvidence(event.id, lockEvent(1)),
            SlashingError::EVIDENCE_REJECTED);
  EXPECT_EC(engine->submitCounterEvidence(event.id, accused),
            SlashingError::EVIDENCE_REJECTED);
  EXPECT_EC(engine->submitCounterEvidence(event.id + 1, lockEvent(1)),
            SlashingError::UNKNOWN_SLASH);

  clock->advance(std::chrono::hours(49));
  ledger_locks.push_back(lockEvent(7));
  EXPECT_EC(engine->submitCounterEvidence(event.id, lockEvent(7)),
            SlashingError::DISPUTE_WINDOW_CLOSED);
  EXPECT_EQ(engine->get(event.id)->status, SlashStatus::Pending);
}

/**
 * @given validator missing attestation windows of expired transfers
 * @when it misses the fifth one in a row
 * @then a pending non-participation slash is opened and the counter restarts
 */
TEST_F(SlashingEngineTest, NonParticipationAfterMissedWindows) {
  auto eligible = keys.ids();
  std::vector attested{keys.id(1), keys.id(2), keys.id(3), keys.id(4)};

  for (uint64_t nonce = 1; nonce <= 4; ++nonce) {
    engine->recordParticipation(qbridge::primitives::makeTransferId(1, nonce),
                                eligible,
                                attested,
                                true);
  }
  EXPECT_EQ(engine->missedWindows(keys.id(0)), 4);
  EXPECT_EQ(engine->missedWindows(keys.id(1)), 0);
  EXPECT_TRUE(notified.empty());

  engine->recordParticipation(
      qbridge::primitives::makeTransferId(1, 5), eligible, attested, true);
  EXPECT_EQ(engine->missedWindows(keys.id(0)), 0);
  ASSERT_EQ(notified.size(), 1);
  EXPECT_EQ(notified[0].reason, SlashReason::NonParticipation);
  EXPECT_EQ(notified[0].validator, keys.id(0));
  EXPECT_EQ(notified[0].status, SlashStatus::Pending);
  EXPECT_EQ(notified[0].transfer_id,
            qbridge::primitives::makeTransferId(1, 5));
}

/**
 * @given validator which missed some windows
 * @when it attests a transfer which completes
 * @then its miss counter is reset
 */
TEST_F(SlashingEngineTest, AttestationResetsMisses) {
  auto eligible = keys.ids();
  std::vector attested{keys.id(1), keys.id(2), keys.id(3)};
  for (uint64_t nonce = 1; nonce <= 3; ++nonce) {
    engine->recordParticipation(qbridge::primitives::makeTransferId(1, nonce),
                                eligible,
                                attested,
                                true);
  }
  EXPECT_EQ(engine->missedWindows(keys.id(0)), 3);
  EXPECT_EQ(engine->missedWindows(keys.id(4)), 3);

  engine->recordParticipation(qbridge::primitives::makeTransferId(1, 4),
                              eligible,
                              {keys.id(0)},
                              false);
  EXPECT_EQ(engine->missedWindows(keys.id(0)), 0);
  EXPECT_EQ(engine->missedWindows(keys.id(4)), 3);
}

/**
 * @given non-participation accusation
 * @when the accused shows its signed attestation for one of the missed
 * transfers
 * @then the slash is overturned
 */
TEST_F(SlashingEngineTest, AttestationRefutesNonParticipation) {
  std::vector<TransferId> missed;
  for (uint64_t nonce = 1; nonce <= 5; ++nonce) {
    missed.push_back(qbridge::primitives::makeTransferId(1, nonce));
  }
  EXPECT_OUTCOME_TRUE(event,
                      engine->reportNonParticipation(keys.id(3), missed));

  auto foreign = keys.attest(4, AttestationPayload::fromLock(lockEvent(1)));
  EXPECT_EC(engine->submitCounterEvidence(event.id, foreign),
            SlashingError::EVIDENCE_REJECTED);

  auto own = keys.attest(3, AttestationPayload::fromLock(lockEvent(1)));
  EXPECT_OUTCOME_TRUE(refuted, engine->submitCounterEvidence(event.id, own));
  EXPECT_EQ(refuted.status, SlashStatus::Overturned);
}

/**
 * @given pending and applied slashes
 * @when an adjudicator overturns them
 * @then only the pending one is overturned
 */
TEST_F(SlashingEngineTest, AdjudicatorOverturnsPendingOnly) {
  auto payload = AttestationPayload::fromLock(lockEvent(1));
  auto forged = payload;
  forged.amount = 1;
  EXPECT_OUTCOME_TRUE(
      applied,
      engine->reportEquivocation(keys.attest(0, payload),
                                 keys.attest(0, forged)));
  EXPECT_OUTCOME_TRUE(
      pending,
      engine->reportInvalidAttestation(
          keys.attest(1, AttestationPayload::fromLock(lockEvent(9)))));

  clock->advance(std::chrono::hours(100));
  EXPECT_OUTCOME_TRUE(overturned, engine->overturn(pending.id));
  EXPECT_EQ(overturned.status, SlashStatus::Overturned);
  EXPECT_EC(engine->overturn(applied.id), SlashingError::NOT_PENDING);
  EXPECT_EC(engine->overturn(1'000), SlashingError::UNKNOWN_SLASH);
  EXPECT_TRUE(engine->finalizeMatured().empty());
  EXPECT_EQ(registry->get(keys.id(1))->stake, 10'000);
}
