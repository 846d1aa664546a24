/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "registry/validator_registry.hpp"

#include <gmock/gmock.h>

namespace qbridge::registry {

  class ValidatorRegistryMock : public ValidatorRegistry {
   public:
    MOCK_METHOD(outcome::result<void>,
                registerValidator,
                (const primitives::ValidatorId &, primitives::Balance),
                (override));

    MOCK_METHOD(outcome::result<primitives::Balance>,
                removeValidator,
                (const primitives::ValidatorId &),
                (override));

    MOCK_METHOD(outcome::result<SlashOutcome>,
                slash,
                (const primitives::ValidatorId &, primitives::BasisPoints),
                (override));

    MOCK_METHOD(outcome::result<Reputation>,
                updateReputation,
                (const primitives::ValidatorId &, int32_t),
                (override));

    MOCK_METHOD(outcome::result<void>,
                recordAttestation,
                (const primitives::ValidatorId &),
                (override));

    MOCK_METHOD(void, applyInactivityDecay, (), (override));

    MOCK_METHOD(outcome::result<void>,
                requestExit,
                (const primitives::ValidatorId &),
                (override));

    MOCK_METHOD(outcome::result<primitives::Balance>,
                completeExit,
                (const primitives::ValidatorId &),
                (override));

    MOCK_METHOD(bool,
                isEligible,
                (const primitives::ValidatorId &),
                (const, override));

    MOCK_METHOD(std::optional<Validator>,
                get,
                (const primitives::ValidatorId &),
                (const, override));

    MOCK_METHOD(std::vector<primitives::ValidatorId>,
                eligibleValidators,
                (),
                (const, override));

    MOCK_METHOD(size_t, eligibleCount, (), (const, override));
  };

}  // namespace qbridge::registry
