/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "registry/validator_registry.hpp"

#include <memory>
#include <unordered_map>

#include "alert/alert_sink.hpp"
#include "log/logger.hpp"
#include "registry/scoring_strategy.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::registry {

  class ValidatorRegistryImpl : public ValidatorRegistry {
   public:
    struct Config {
      primitives::Balance min_stake = 0;
      Reputation min_reputation = 50;
      Reputation initial_reputation = 70;
      clock::SystemClock::Duration exit_cooldown = std::chrono::days(7);
      clock::SystemClock::Duration decay_interval = std::chrono::hours(24);
      size_t min_active_validators = 3;
    };

    ValidatorRegistryImpl(Config config,
                          std::shared_ptr<clock::SystemClock> clock,
                          std::shared_ptr<ScoringStrategy> scoring,
                          std::shared_ptr<alert::AlertSink> alert_sink);

    outcome::result<void> registerValidator(const primitives::ValidatorId &id,
                                            primitives::Balance stake) override;

    outcome::result<primitives::Balance> removeValidator(
        const primitives::ValidatorId &id) override;

    outcome::result<SlashOutcome> slash(const primitives::ValidatorId &id,
                                        primitives::BasisPoints bps) override;

    outcome::result<Reputation> updateReputation(
        const primitives::ValidatorId &id, int32_t delta) override;

    outcome::result<void> recordAttestation(
        const primitives::ValidatorId &id) override;

    void applyInactivityDecay() override;

    outcome::result<void> requestExit(
        const primitives::ValidatorId &id) override;

    outcome::result<primitives::Balance> completeExit(
        const primitives::ValidatorId &id) override;

    bool isEligible(const primitives::ValidatorId &id) const override;

    std::optional<Validator> get(
        const primitives::ValidatorId &id) const override;

    std::vector<primitives::ValidatorId> eligibleValidators() const override;

    size_t eligibleCount() const override;

   private:
    using Validators =
        std::unordered_map<primitives::ValidatorId, Validator>;

    bool eligible(const Validator &validator) const;
    size_t countEligible(const Validators &validators) const;
    static Reputation clamp(int64_t reputation);

    /// Raises an alert when the eligible set is smaller than allowed
    void checkSetSize(size_t eligible_count);

    Config config_;
    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<ScoringStrategy> scoring_;
    std::shared_ptr<alert::AlertSink> alert_sink_;
    log::Logger logger_;

    SafeObject<Validators> validators_;
  };

}  // namespace qbridge::registry
