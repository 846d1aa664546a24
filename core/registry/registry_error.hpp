/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace qbridge::registry {

  enum class RegistryError {
    INSUFFICIENT_STAKE = 1,
    ALREADY_REGISTERED,
    UNKNOWN_VALIDATOR,
    EXIT_ALREADY_REQUESTED,
    EXIT_NOT_REQUESTED,
    COOLDOWN_NOT_ELAPSED,
    VALIDATOR_SET_TOO_SMALL,
  };

}  // namespace qbridge::registry

OUTCOME_HPP_DECLARE_ERROR(qbridge::registry, RegistryError);
