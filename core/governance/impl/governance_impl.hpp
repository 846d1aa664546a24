/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "governance/governance.hpp"

#include <map>
#include <memory>

#include "chain/chain_config_store.hpp"
#include "crypto/ed25519_provider.hpp"
#include "log/logger.hpp"
#include "registry/validator_registry.hpp"
#include "transfer/transfer_state_machine.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::governance {

  class GovernanceImpl : public Governance {
   public:
    struct Config {
      std::vector<MemberId> members;
      size_t approvals_required = 1;
      clock::SystemClock::Duration proposal_ttl = std::chrono::days(7);
    };

    GovernanceImpl(Config config,
                   std::shared_ptr<registry::ValidatorRegistry> registry,
                   std::shared_ptr<chain::ChainConfigStore> configs,
                   std::shared_ptr<transfer::TransferStateMachine> transfers,
                   std::shared_ptr<crypto::Ed25519Provider> crypto,
                   std::shared_ptr<clock::SystemClock> clock);

    outcome::result<ProposalId> propose(const MemberId &proposer,
                                        Action action) override;

    outcome::result<size_t> approve(
        ProposalId id,
        const MemberId &member,
        const crypto::Ed25519Signature &signature) override;

    outcome::result<void> execute(ProposalId id) override;

    std::optional<Proposal> get(ProposalId id) const override;

    bool isMember(const MemberId &id) const override;

    size_t approvalsRequired() const override {
      return config_.approvals_required;
    }

   private:
    outcome::result<void> apply(const Action &action);

    Config config_;
    std::shared_ptr<registry::ValidatorRegistry> registry_;
    std::shared_ptr<chain::ChainConfigStore> configs_;
    std::shared_ptr<transfer::TransferStateMachine> transfers_;
    std::shared_ptr<crypto::Ed25519Provider> crypto_;
    std::shared_ptr<clock::SystemClock> clock_;
    log::Logger logger_;

    struct State {
      ProposalId next_id = 1;
      std::map<ProposalId, Proposal> proposals;
    };
    SafeObject<State> state_;
  };

}  // namespace qbridge::governance
