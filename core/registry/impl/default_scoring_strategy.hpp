/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "registry/scoring_strategy.hpp"

namespace qbridge::registry {

  class DefaultScoringStrategy : public ScoringStrategy {
   public:
    struct Params {
      primitives::BasisPoints equivocation_bps = 1000;
      primitives::BasisPoints invalid_attestation_bps = 1000;
      primitives::BasisPoints non_participation_bps = 100;
      int32_t equivocation_penalty = 50;
      int32_t invalid_attestation_penalty = 30;
      int32_t non_participation_penalty = 10;
      int32_t attestation_reward = 1;
      int32_t inactivity_decay = 1;
    };

    DefaultScoringStrategy() = default;
    explicit DefaultScoringStrategy(Params params) : params_{params} {}

    primitives::BasisPoints slashBasisPoints(
        primitives::SlashReason reason) const override;

    int32_t reputationPenalty(primitives::SlashReason reason) const override;

    int32_t attestationReward() const override {
      return params_.attestation_reward;
    }

    int32_t inactivityDecay() const override {
      return params_.inactivity_decay;
    }

   private:
    Params params_;
  };

}  // namespace qbridge::registry
