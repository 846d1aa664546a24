/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "governance/governance_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(qbridge::governance, GovernanceError, e) {
  using E = qbridge::governance::GovernanceError;
  switch (e) {
    case E::NOT_A_MEMBER:
      return "Key is not a governance member";
    case E::INVALID_SIGNATURE:
      return "Approval signature is invalid";
    case E::UNKNOWN_PROPOSAL:
      return "Proposal is unknown";
    case E::ALREADY_APPROVED:
      return "Member has already approved the proposal";
    case E::ALREADY_EXECUTED:
      return "Proposal has already been executed";
    case E::PROPOSAL_EXPIRED:
      return "Proposal has expired";
    case E::NOT_ENOUGH_APPROVALS:
      return "Proposal lacks approvals";
  }
  return "Unknown error in governance";
}
