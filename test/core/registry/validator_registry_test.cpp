/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/impl/validator_registry_impl.hpp"

#include <algorithm>
#include <limits>

#include <gtest/gtest.h>

#include "mock/core/alert/alert_sink_mock.hpp"
#include "registry/impl/default_scoring_strategy.hpp"
#include "registry/registry_error.hpp"
#include "testutil/manual_clock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using qbridge::alert::Alert;
using qbridge::alert::AlertSinkMock;
using qbridge::alert::AlertType;
using qbridge::primitives::ValidatorId;
using qbridge::registry::DefaultScoringStrategy;
using qbridge::registry::RegistryError;
using qbridge::registry::ValidatorRegistryImpl;
using testing::_;
using testing::Field;
using testing::NiceMock;

class ValidatorRegistryTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  static ValidatorId validator(uint8_t n) {
    ValidatorId id;
    id.fill(n);
    return id;
  }

  void registerFive() {
    for (uint8_t i = 1; i <= 5; ++i) {
      EXPECT_OUTCOME_TRUE_1(registry->registerValidator(validator(i), 10'000));
    }
  }

  ValidatorRegistryImpl::Config config{
      .min_stake = 1'000,
      .min_reputation = 50,
      .initial_reputation = 70,
      .exit_cooldown = std::chrono::days(7),
      .decay_interval = std::chrono::hours(24),
      .min_active_validators = 3,
  };
  std::shared_ptr<testutil::ManualClock> clock =
      std::make_shared<testutil::ManualClock>();
  std::shared_ptr<NiceMock<AlertSinkMock>> alert_sink =
      std::make_shared<NiceMock<AlertSinkMock>>();
  std::shared_ptr<ValidatorRegistryImpl> registry =
      std::make_shared<ValidatorRegistryImpl>(
          config,
          clock,
          std::make_shared<DefaultScoringStrategy>(),
          alert_sink);
};

/**
 * @given registry with minimal stake of 1000
 * @when validators with 999 and 1000 stake register
 * @then the first is refused with INSUFFICIENT_STAKE, the second is eligible
 */
TEST_F(ValidatorRegistryTest, RegisterRequiresMinimalStake) {
  EXPECT_EC(registry->registerValidator(validator(1), 999),
            RegistryError::INSUFFICIENT_STAKE);
  EXPECT_FALSE(registry->get(validator(1)).has_value());

  EXPECT_OUTCOME_TRUE_1(registry->registerValidator(validator(2), 1'000));
  EXPECT_TRUE(registry->isEligible(validator(2)));
  auto stored = registry->get(validator(2));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->stake, 1'000);
  EXPECT_EQ(stored->reputation, 70);
  EXPECT_TRUE(stored->active);

  EXPECT_EC(registry->registerValidator(validator(2), 5'000),
            RegistryError::ALREADY_REGISTERED);
}

/**
 * @given validator with stake 10000
 * @when it is slashed by 10%, then by 0, then by more than 100%
 * @then stake drops by exactly stake * bps / 10000 and never below zero
 */
TEST_F(ValidatorRegistryTest, SlashTakesExactShare) {
  EXPECT_OUTCOME_TRUE_1(registry->registerValidator(validator(1), 10'000));

  EXPECT_OUTCOME_TRUE(first, registry->slash(validator(1), 1'000));
  EXPECT_EQ(first.slashed, 1'000);
  EXPECT_EQ(first.remaining_stake, 9'000);
  EXPECT_FALSE(first.lost_eligibility);

  EXPECT_OUTCOME_TRUE(second, registry->slash(validator(1), 0));
  EXPECT_EQ(second.slashed, 0);
  EXPECT_EQ(second.remaining_stake, 9'000);

  EXPECT_OUTCOME_TRUE(third, registry->slash(validator(1), 20'000));
  EXPECT_EQ(third.slashed, 9'000);
  EXPECT_EQ(third.remaining_stake, 0);
  EXPECT_TRUE(third.lost_eligibility);
  EXPECT_FALSE(registry->isEligible(validator(1)));

  EXPECT_EC(registry->slash(validator(9), 100),
            RegistryError::UNKNOWN_VALIDATOR);
}

/**
 * @given validator with stake just above the minimum
 * @when a slash brings it below the minimal stake
 * @then the validator loses eligibility at once
 */
TEST_F(ValidatorRegistryTest, SlashBelowMinimalStakeRemovesEligibility) {
  EXPECT_OUTCOME_TRUE_1(registry->registerValidator(validator(1), 1'050));
  EXPECT_OUTCOME_TRUE(res, registry->slash(validator(1), 1'000));
  EXPECT_EQ(res.slashed, 105);
  EXPECT_TRUE(res.lost_eligibility);
  EXPECT_FALSE(registry->isEligible(validator(1)));
}

/**
 * @given validator with reputation 70
 * @when reputation is raised and lowered far beyond the bounds
 * @then it is clamped into [0, 100]
 */
TEST_F(ValidatorRegistryTest, ReputationIsClamped) {
  EXPECT_OUTCOME_TRUE_1(registry->registerValidator(validator(1), 10'000));

  EXPECT_OUTCOME_TRUE(high, registry->updateReputation(validator(1), 500));
  EXPECT_EQ(high, 100);
  EXPECT_OUTCOME_TRUE(low, registry->updateReputation(validator(1), -1'000));
  EXPECT_EQ(low, 0);
  EXPECT_FALSE(registry->isEligible(validator(1)));

  EXPECT_EC(registry->updateReputation(validator(2), 1),
            RegistryError::UNKNOWN_VALIDATOR);
}

/**
 * @given validator with reputation 70
 * @when reputation changes by the extreme values of the delta type
 * @then the sum does not wrap around and is clamped into [0, 100]
 */
TEST_F(ValidatorRegistryTest, ExtremeReputationDeltaClamped) {
  EXPECT_OUTCOME_TRUE_1(registry->registerValidator(validator(1), 10'000));

  EXPECT_OUTCOME_TRUE(
      high,
      registry->updateReputation(validator(1),
                                 std::numeric_limits<int32_t>::max()));
  EXPECT_EQ(high, 100);
  EXPECT_OUTCOME_TRUE(
      low,
      registry->updateReputation(validator(1),
                                 std::numeric_limits<int32_t>::min()));
  EXPECT_EQ(low, 0);
}

/**
 * @given five eligible validators and a minimal set of three
 * @when three of them lose eligibility one after another
 * @then an alert about the shrunk set is raised only when fewer than three
 * remain
 */
TEST_F(ValidatorRegistryTest, AlertWhenSetBelowMinimum) {
  registerFive();

  EXPECT_CALL(*alert_sink,
              raise(Field(&Alert::type, AlertType::ValidatorSetBelowMinimum)))
      .Times(1);

  EXPECT_OUTCOME_TRUE_1(registry->updateReputation(validator(1), -100));
  EXPECT_OUTCOME_TRUE_1(registry->updateReputation(validator(2), -100));
  EXPECT_EQ(registry->eligibleCount(), 3);
  EXPECT_OUTCOME_TRUE_1(registry->updateReputation(validator(3), -100));
  EXPECT_EQ(registry->eligibleCount(), 2);
}

/**
 * @given validator with reputation 70 which attests every day
 * @when decay is applied after several days
 * @then only validators idle for whole intervals lose reputation
 */
TEST_F(ValidatorRegistryTest, InactivityDecayAndReward) {
  EXPECT_OUTCOME_TRUE_1(registry->registerValidator(validator(1), 10'000));
  EXPECT_OUTCOME_TRUE_1(registry->registerValidator(validator(2), 10'000));

  clock->advance(std::chrono::hours(23));
  registry->applyInactivityDecay();
  EXPECT_EQ(registry->get(validator(1))->reputation, 70);

  EXPECT_OUTCOME_TRUE_1(registry->recordAttestation(validator(2)));
  EXPECT_EQ(registry->get(validator(2))->reputation, 71);

  clock->advance(std::chrono::hours(49));
  registry->applyInactivityDecay();
  // validator 1 idle for 72h, validator 2 for 49h
  EXPECT_EQ(registry->get(validator(1))->reputation, 67);
  EXPECT_EQ(registry->get(validator(2))->reputation, 69);

  registry->applyInactivityDecay();
  EXPECT_EQ(registry->get(validator(1))->reputation, 67);
}

/**
 * @given five eligible validators
 * @when one requests an exit and tries to complete it before and after the
 * cooldown
 * @then it is inactive at once and removed only after the cooldown
 */
TEST_F(ValidatorRegistryTest, VoluntaryExitAfterCooldown) {
  registerFive();

  EXPECT_EC(registry->completeExit(validator(1)),
            RegistryError::EXIT_NOT_REQUESTED);
  EXPECT_OUTCOME_TRUE_1(registry->requestExit(validator(1)));
  EXPECT_FALSE(registry->isEligible(validator(1)));
  EXPECT_EC(registry->requestExit(validator(1)),
            RegistryError::EXIT_ALREADY_REQUESTED);

  clock->advance(std::chrono::days(6));
  EXPECT_EC(registry->completeExit(validator(1)),
            RegistryError::COOLDOWN_NOT_ELAPSED);

  clock->advance(std::chrono::days(1));
  EXPECT_OUTCOME_TRUE(stake, registry->completeExit(validator(1)));
  EXPECT_EQ(stake, 10'000);
  EXPECT_FALSE(registry->get(validator(1)).has_value());
}

/**
 * @given exactly the minimal number of eligible validators
 * @when one of them requests an exit
 * @then the exit is refused with VALIDATOR_SET_TOO_SMALL
 */
TEST_F(ValidatorRegistryTest, ExitRefusedAtMinimalSet) {
  for (uint8_t i = 1; i <= 3; ++i) {
    EXPECT_OUTCOME_TRUE_1(registry->registerValidator(validator(i), 10'000));
  }
  EXPECT_EC(registry->requestExit(validator(1)),
            RegistryError::VALIDATOR_SET_TOO_SMALL);
  EXPECT_TRUE(registry->isEligible(validator(1)));
}

/**
 * @given five validators
 * @when governance removes one
 * @then its stake is returned and it is gone from the eligible set
 */
TEST_F(ValidatorRegistryTest, RemoveValidator) {
  registerFive();
  EXPECT_OUTCOME_TRUE(stake, registry->removeValidator(validator(3)));
  EXPECT_EQ(stake, 10'000);
  EXPECT_EQ(registry->eligibleCount(), 4);
  auto eligible = registry->eligibleValidators();
  EXPECT_EQ(std::ranges::count(eligible, validator(3)), 0);
  EXPECT_TRUE(std::ranges::is_sorted(eligible));

  EXPECT_EC(registry->removeValidator(validator(3)),
            RegistryError::UNKNOWN_VALIDATOR);
}
