/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/slash_event.hpp"

namespace qbridge::registry {

  /**
   * Penalty arithmetic and reputation heuristics. Swappable without touching
   * the registry or the slashing engine.
   */
  class ScoringStrategy {
   public:
    virtual ~ScoringStrategy() = default;

    /// Share of the current stake taken for the misbehaviour
    virtual primitives::BasisPoints slashBasisPoints(
        primitives::SlashReason reason) const = 0;

    /// Reputation delta applied along with the slash, not positive
    virtual int32_t reputationPenalty(primitives::SlashReason reason) const = 0;

    /// Reputation delta for a timely correct attestation
    virtual int32_t attestationReward() const = 0;

    /// Reputation lost per full decay interval of inactivity
    virtual int32_t inactivityDecay() const = 0;
  };

}  // namespace qbridge::registry
