/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "clock/clock.hpp"
#include "common/buffer.hpp"
#include "crypto/ed25519_types.hpp"
#include "governance/action.hpp"

namespace qbridge::governance {

  using MemberId = crypto::Ed25519PublicKey;
  using ProposalId = uint64_t;

  struct Proposal {
    ProposalId id = 0;
    Action action;
    MemberId proposer;
    std::vector<MemberId> approvals;
    clock::TimePoint created_at;
    clock::TimePoint expires_at;
    bool executed = false;
  };

  /// Domain separation of governance approvals
  constexpr std::string_view kApprovalSigningContext = "qbridge/govern/v1";

  /// Bytes a governor signs to approve the proposal
  common::Buffer approvalSigningMessage(ProposalId id, const Action &action);

}  // namespace qbridge::governance
