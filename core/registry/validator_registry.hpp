/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "outcome/outcome.hpp"
#include "registry/validator.hpp"

namespace qbridge::registry {

  /**
   * Staked validators and their standing. Only eligible validators are
   * counted toward an attestation threshold.
   */
  class ValidatorRegistry {
   public:
    virtual ~ValidatorRegistry() = default;

    virtual outcome::result<void> registerValidator(
        const primitives::ValidatorId &id, primitives::Balance stake) = 0;

    /// Governance removal, bypasses the exit cooldown
    virtual outcome::result<primitives::Balance> removeValidator(
        const primitives::ValidatorId &id) = 0;

    /**
     * Reduces stake by exactly `stake * bps / 10000`, never below zero
     */
    virtual outcome::result<SlashOutcome> slash(
        const primitives::ValidatorId &id, primitives::BasisPoints bps) = 0;

    /// @return reputation after clamping into [0, 100]
    virtual outcome::result<Reputation> updateReputation(
        const primitives::ValidatorId &id, int32_t delta) = 0;

    /// Rewards a timely correct attestation and refreshes activity
    virtual outcome::result<void> recordAttestation(
        const primitives::ValidatorId &id) = 0;

    /// Lowers reputation of validators idle for whole decay intervals
    virtual void applyInactivityDecay() = 0;

    /// Deactivates the validator and starts the exit cooldown
    virtual outcome::result<void> requestExit(
        const primitives::ValidatorId &id) = 0;

    /// Removes the validator once the cooldown elapsed
    /// @return stake to be returned
    virtual outcome::result<primitives::Balance> completeExit(
        const primitives::ValidatorId &id) = 0;

    virtual bool isEligible(const primitives::ValidatorId &id) const = 0;

    virtual std::optional<Validator> get(
        const primitives::ValidatorId &id) const = 0;

    virtual std::vector<primitives::ValidatorId> eligibleValidators()
        const = 0;

    virtual size_t eligibleCount() const = 0;
  };

}  // namespace qbridge::registry
