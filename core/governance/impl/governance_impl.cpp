/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "governance/impl/governance_impl.hpp"

#include <algorithm>

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include "governance/governance_error.hpp"

namespace qbridge::governance {

  GovernanceImpl::GovernanceImpl(
      Config config,
      std::shared_ptr<registry::ValidatorRegistry> registry,
      std::shared_ptr<chain::ChainConfigStore> configs,
      std::shared_ptr<transfer::TransferStateMachine> transfers,
      std::shared_ptr<crypto::Ed25519Provider> crypto,
      std::shared_ptr<clock::SystemClock> clock)
      : config_{std::move(config)},
        registry_{std::move(registry)},
        configs_{std::move(configs)},
        transfers_{std::move(transfers)},
        crypto_{std::move(crypto)},
        clock_{std::move(clock)},
        logger_{log::createLogger("Governance", "governance")} {
    BOOST_ASSERT(registry_);
    BOOST_ASSERT(configs_);
    BOOST_ASSERT(transfers_);
    BOOST_ASSERT(crypto_);
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(config_.approvals_required > 0);
    BOOST_ASSERT(config_.approvals_required <= config_.members.size());
  }

  bool GovernanceImpl::isMember(const MemberId &id) const {
    return std::ranges::find(config_.members, id) != config_.members.end();
  }

  outcome::result<ProposalId> GovernanceImpl::propose(const MemberId &proposer,
                                                      Action action) {
    if (not isMember(proposer)) {
      return GovernanceError::NOT_A_MEMBER;
    }
    auto now = clock_->now();
    auto id = state_.exclusiveAccess([&](State &state) {
      auto id = state.next_id++;
      state.proposals.emplace(id,
                              Proposal{.id = id,
                                       .action = std::move(action),
                                       .proposer = proposer,
                                       .approvals = {},
                                       .created_at = now,
                                       .expires_at = now + config_.proposal_ttl,
                                       .executed = false});
      return id;
    });
    SL_INFO(logger_, "Proposal #{} submitted by {}", id, proposer);
    return id;
  }

  outcome::result<size_t> GovernanceImpl::approve(
      ProposalId id,
      const MemberId &member,
      const crypto::Ed25519Signature &signature) {
    if (not isMember(member)) {
      return GovernanceError::NOT_A_MEMBER;
    }
    auto proposal = get(id);
    if (not proposal) {
      return GovernanceError::UNKNOWN_PROPOSAL;
    }
    auto message = approvalSigningMessage(id, proposal->action);
    OUTCOME_TRY(valid, crypto_->verify(signature, message, member));
    if (not valid) {
      SL_WARN(logger_, "Invalid approval of proposal #{} by {}", id, member);
      return GovernanceError::INVALID_SIGNATURE;
    }

    auto now = clock_->now();
    return state_.exclusiveAccess([&](State &state) -> outcome::result<size_t> {
      auto it = state.proposals.find(id);
      if (it == state.proposals.end()) {
        return GovernanceError::UNKNOWN_PROPOSAL;
      }
      auto &p = it->second;
      if (p.executed) {
        return GovernanceError::ALREADY_EXECUTED;
      }
      if (now >= p.expires_at) {
        return GovernanceError::PROPOSAL_EXPIRED;
      }
      if (std::ranges::find(p.approvals, member) != p.approvals.end()) {
        return GovernanceError::ALREADY_APPROVED;
      }
      p.approvals.push_back(member);
      SL_DEBUG(logger_,
               "Proposal #{} approved by {} ({}/{})",
               id,
               member,
               p.approvals.size(),
               config_.approvals_required);
      return p.approvals.size();
    });
  }

  outcome::result<void> GovernanceImpl::execute(ProposalId id) {
    auto now = clock_->now();
    // claimed under the lock so that concurrent calls execute once
    auto claimed = state_.exclusiveAccess(
        [&](State &state) -> outcome::result<Action> {
          auto it = state.proposals.find(id);
          if (it == state.proposals.end()) {
            return GovernanceError::UNKNOWN_PROPOSAL;
          }
          auto &p = it->second;
          if (p.executed) {
            return GovernanceError::ALREADY_EXECUTED;
          }
          if (now >= p.expires_at) {
            return GovernanceError::PROPOSAL_EXPIRED;
          }
          if (p.approvals.size() < config_.approvals_required) {
            return GovernanceError::NOT_ENOUGH_APPROVALS;
          }
          p.executed = true;
          return p.action;
        });
    OUTCOME_TRY(action, claimed);

    SL_INFO(logger_, "Executing proposal #{}: {}", id, actionName(action));
    auto res = apply(action);
    if (res.has_error()) {
      SL_WARN(logger_,
              "Proposal #{} failed: {}",
              id,
              res.error().message());
      state_.exclusiveAccess(
          [&](State &state) { state.proposals.at(id).executed = false; });
    }
    return res;
  }

  outcome::result<void> GovernanceImpl::apply(const Action &action) {
    if (auto a = std::get_if<RegisterValidator>(&action)) {
      return registry_->registerValidator(a->validator, a->stake);
    }
    if (auto a = std::get_if<RemoveValidator>(&action)) {
      OUTCOME_TRY(stake, registry_->removeValidator(a->validator));
      SL_INFO(logger_,
              "Validator {} removed, {} of stake released",
              a->validator,
              stake);
      return outcome::success();
    }
    if (auto a = std::get_if<UpdateThresholds>(&action)) {
      OUTCOME_TRY(configs_->updateThresholds(
          a->chain_id, a->attestation_threshold, a->confirmations_required));
      return outcome::success();
    }
    if (std::holds_alternative<Pause>(action)) {
      transfers_->setPaused(true);
      return outcome::success();
    }
    if (std::holds_alternative<Unpause>(action)) {
      transfers_->setPaused(false);
      return outcome::success();
    }
    BOOST_UNREACHABLE_RETURN(outcome::success());
  }

  std::optional<Proposal> GovernanceImpl::get(ProposalId id) const {
    return state_.sharedAccess(
        [&](const State &state) -> std::optional<Proposal> {
          auto it = state.proposals.find(id);
          if (it == state.proposals.end()) {
            return std::nullopt;
          }
          return it->second;
        });
  }

}  // namespace qbridge::governance
