/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "governance/proposal.hpp"
#include "outcome/outcome.hpp"

namespace qbridge::governance {

  /**
   * M-of-N control of privileged operations. Any member proposes, an action
   * is executed only after the required number of distinct members signed
   * their approval.
   */
  class Governance {
   public:
    virtual ~Governance() = default;

    virtual outcome::result<ProposalId> propose(const MemberId &proposer,
                                                Action action) = 0;

    /**
     * Records the approval of a member
     * @param signature over approvalSigningMessage() of the proposal
     * @return number of approvals collected
     */
    virtual outcome::result<size_t> approve(
        ProposalId id,
        const MemberId &member,
        const crypto::Ed25519Signature &signature) = 0;

    /// Executes a sufficiently approved proposal once
    virtual outcome::result<void> execute(ProposalId id) = 0;

    virtual std::optional<Proposal> get(ProposalId id) const = 0;

    virtual bool isMember(const MemberId &id) const = 0;

    virtual size_t approvalsRequired() const = 0;
  };

}  // namespace qbridge::governance
