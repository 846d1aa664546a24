/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace qbridge::slashing {

  enum class SlashingError {
    UNKNOWN_SLASH = 1,
    INVALID_SIGNATURE,
    NOT_EQUIVOCATION,
    ALREADY_REPORTED,
    NOT_PENDING,
    DISPUTE_WINDOW_CLOSED,
    EVIDENCE_REJECTED,
  };

}  // namespace qbridge::slashing

OUTCOME_HPP_DECLARE_ERROR(qbridge::slashing, SlashingError);
