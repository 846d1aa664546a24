/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "clock/clock.hpp"
#include "primitives/common.hpp"

namespace qbridge::registry {

  using Reputation = uint8_t;
  constexpr Reputation kMaxReputation = 100;

  struct Validator {
    primitives::ValidatorId id;
    primitives::Balance stake = 0;
    Reputation reputation = 0;
    bool active = true;
    clock::TimePoint registered_at;
    clock::TimePoint last_activity_at;
    clock::TimePoint last_decay_at;
    std::optional<clock::TimePoint> exit_requested_at;
  };

  struct SlashOutcome {
    primitives::Balance slashed = 0;
    primitives::Balance remaining_stake = 0;
    bool lost_eligibility = false;
  };

}  // namespace qbridge::registry
