/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace qbridge::governance {

  enum class GovernanceError {
    NOT_A_MEMBER = 1,
    INVALID_SIGNATURE,
    UNKNOWN_PROPOSAL,
    ALREADY_APPROVED,
    ALREADY_EXECUTED,
    PROPOSAL_EXPIRED,
    NOT_ENOUGH_APPROVALS,
  };

}  // namespace qbridge::governance

OUTCOME_HPP_DECLARE_ERROR(qbridge::governance, GovernanceError);
