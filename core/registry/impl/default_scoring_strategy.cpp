/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/impl/default_scoring_strategy.hpp"

namespace qbridge::registry {

  using primitives::SlashReason;

  primitives::BasisPoints DefaultScoringStrategy::slashBasisPoints(
      SlashReason reason) const {
    switch (reason) {
      case SlashReason::Equivocation:
        return params_.equivocation_bps;
      case SlashReason::InvalidAttestation:
        return params_.invalid_attestation_bps;
      case SlashReason::NonParticipation:
        return params_.non_participation_bps;
    }
    return 0;
  }

  int32_t DefaultScoringStrategy::reputationPenalty(SlashReason reason) const {
    switch (reason) {
      case SlashReason::Equivocation:
        return -params_.equivocation_penalty;
      case SlashReason::InvalidAttestation:
        return -params_.invalid_attestation_penalty;
      case SlashReason::NonParticipation:
        return -params_.non_participation_penalty;
    }
    return 0;
  }

}  // namespace qbridge::registry
