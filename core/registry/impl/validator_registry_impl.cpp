/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/impl/validator_registry_impl.hpp"

#include <algorithm>

#include <boost/assert.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include "registry/registry_error.hpp"

namespace qbridge::registry {

  using primitives::Balance;
  using primitives::ValidatorId;

  ValidatorRegistryImpl::ValidatorRegistryImpl(
      Config config,
      std::shared_ptr<clock::SystemClock> clock,
      std::shared_ptr<ScoringStrategy> scoring,
      std::shared_ptr<alert::AlertSink> alert_sink)
      : config_{config},
        clock_{std::move(clock)},
        scoring_{std::move(scoring)},
        alert_sink_{std::move(alert_sink)},
        logger_{log::createLogger("ValidatorRegistry", "registry")} {
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(scoring_);
    BOOST_ASSERT(alert_sink_);
  }

  Reputation ValidatorRegistryImpl::clamp(int64_t reputation) {
    return static_cast<Reputation>(
        std::clamp<int64_t>(reputation, 0, kMaxReputation));
  }

  bool ValidatorRegistryImpl::eligible(const Validator &validator) const {
    return validator.active and validator.stake >= config_.min_stake
       and validator.reputation >= config_.min_reputation;
  }

  size_t ValidatorRegistryImpl::countEligible(
      const Validators &validators) const {
    return std::ranges::count_if(validators, [&](const auto &entry) {
      return eligible(entry.second);
    });
  }

  void ValidatorRegistryImpl::checkSetSize(size_t eligible_count) {
    if (eligible_count >= config_.min_active_validators) {
      return;
    }
    SL_WARN(logger_,
            "Eligible validator set shrank to {} (minimum is {})",
            eligible_count,
            config_.min_active_validators);
    alert_sink_->raise(alert::Alert{
        .type = alert::AlertType::ValidatorSetBelowMinimum,
        .description = fmt::format("{} eligible validators, {} required",
                                   eligible_count,
                                   config_.min_active_validators),
        .at = clock_->now(),
    });
  }

  outcome::result<void> ValidatorRegistryImpl::registerValidator(
      const ValidatorId &id, Balance stake) {
    if (stake < config_.min_stake) {
      SL_DEBUG(logger_,
               "Validator {} rejected: stake {} is below minimum {}",
               id,
               stake,
               config_.min_stake);
      return RegistryError::INSUFFICIENT_STAKE;
    }
    auto now = clock_->now();
    return validators_.exclusiveAccess(
        [&](Validators &validators) -> outcome::result<void> {
          auto [it, inserted] = validators.emplace(
              id,
              Validator{.id = id,
                        .stake = stake,
                        .reputation = config_.initial_reputation,
                        .active = true,
                        .registered_at = now,
                        .last_activity_at = now,
                        .last_decay_at = now});
          if (not inserted) {
            return RegistryError::ALREADY_REGISTERED;
          }
          SL_INFO(logger_, "Validator {} registered with stake {}", id, stake);
          return outcome::success();
        });
  }

  outcome::result<Balance> ValidatorRegistryImpl::removeValidator(
      const ValidatorId &id) {
    size_t remaining = 0;
    auto res = validators_.exclusiveAccess(
        [&](Validators &validators) -> outcome::result<Balance> {
          auto it = validators.find(id);
          if (it == validators.end()) {
            return RegistryError::UNKNOWN_VALIDATOR;
          }
          auto stake = it->second.stake;
          validators.erase(it);
          remaining = countEligible(validators);
          return stake;
        });
    OUTCOME_TRY(stake, res);
    SL_INFO(logger_, "Validator {} removed by governance", id);
    checkSetSize(remaining);
    return stake;
  }

  outcome::result<SlashOutcome> ValidatorRegistryImpl::slash(
      const ValidatorId &id, primitives::BasisPoints bps) {
    using boost::multiprecision::uint128_t;
    bps = std::min(bps, primitives::kBasisPointsDenominator);

    std::optional<size_t> remaining;
    auto res = validators_.exclusiveAccess(
        [&](Validators &validators) -> outcome::result<SlashOutcome> {
          auto it = validators.find(id);
          if (it == validators.end()) {
            return RegistryError::UNKNOWN_VALIDATOR;
          }
          auto &validator = it->second;
          auto was_eligible = eligible(validator);

          auto slashed = static_cast<Balance>(
              uint128_t{validator.stake} * bps
              / primitives::kBasisPointsDenominator);
          validator.stake -= slashed;

          SlashOutcome slash_outcome{.slashed = slashed,
                               .remaining_stake = validator.stake,
                               .lost_eligibility =
                                   was_eligible and not eligible(validator)};
          if (slash_outcome.lost_eligibility) {
            remaining = countEligible(validators);
          }
          return slash_outcome;
        });
    OUTCOME_TRY(slash_outcome, res);
    SL_INFO(logger_,
            "Validator {} slashed by {} ({} bps), stake left {}",
            id,
            slash_outcome.slashed,
            bps,
            slash_outcome.remaining_stake);
    if (remaining) {
      checkSetSize(*remaining);
    }
    return slash_outcome;
  }

  outcome::result<Reputation> ValidatorRegistryImpl::updateReputation(
      const ValidatorId &id, int32_t delta) {
    std::optional<size_t> remaining;
    auto res = validators_.exclusiveAccess(
        [&](Validators &validators) -> outcome::result<Reputation> {
          auto it = validators.find(id);
          if (it == validators.end()) {
            return RegistryError::UNKNOWN_VALIDATOR;
          }
          auto &validator = it->second;
          auto was_eligible = eligible(validator);
          validator.reputation = clamp(int64_t{validator.reputation} + delta);
          if (was_eligible and not eligible(validator)) {
            remaining = countEligible(validators);
          }
          return validator.reputation;
        });
    OUTCOME_TRY(reputation, res);
    SL_DEBUG(logger_,
             "Reputation of validator {} changed by {} to {}",
             id,
             delta,
             reputation);
    if (remaining) {
      checkSetSize(*remaining);
    }
    return reputation;
  }

  outcome::result<void> ValidatorRegistryImpl::recordAttestation(
      const ValidatorId &id) {
    auto now = clock_->now();
    auto reward = scoring_->attestationReward();
    return validators_.exclusiveAccess(
        [&](Validators &validators) -> outcome::result<void> {
          auto it = validators.find(id);
          if (it == validators.end()) {
            return RegistryError::UNKNOWN_VALIDATOR;
          }
          auto &validator = it->second;
          validator.reputation = clamp(int64_t{validator.reputation} + reward);
          validator.last_activity_at = now;
          validator.last_decay_at = now;
          return outcome::success();
        });
  }

  void ValidatorRegistryImpl::applyInactivityDecay() {
    if (config_.decay_interval <= clock::SystemClock::Duration::zero()) {
      return;
    }
    auto now = clock_->now();
    auto decay = scoring_->inactivityDecay();
    std::optional<size_t> remaining;
    validators_.exclusiveAccess([&](Validators &validators) {
      bool lost = false;
      for (auto &[id, validator] : validators) {
        auto idle = now - validator.last_decay_at;
        auto intervals = idle / config_.decay_interval;
        if (intervals <= 0) {
          continue;
        }
        auto was_eligible = eligible(validator);
        auto steps = static_cast<int32_t>(
            std::min<int64_t>(intervals, kMaxReputation));
        validator.reputation =
            clamp(int64_t{validator.reputation} - int64_t{decay} * steps);
        validator.last_decay_at += intervals * config_.decay_interval;
        SL_TRACE(logger_,
                 "Validator {} idle for {} intervals, reputation {}",
                 id,
                 intervals,
                 validator.reputation);
        lost = lost or (was_eligible and not eligible(validator));
      }
      if (lost) {
        remaining = countEligible(validators);
      }
    });
    if (remaining) {
      checkSetSize(*remaining);
    }
  }

  outcome::result<void> ValidatorRegistryImpl::requestExit(
      const ValidatorId &id) {
    auto now = clock_->now();
    return validators_.exclusiveAccess(
        [&](Validators &validators) -> outcome::result<void> {
          auto it = validators.find(id);
          if (it == validators.end()) {
            return RegistryError::UNKNOWN_VALIDATOR;
          }
          auto &validator = it->second;
          if (validator.exit_requested_at.has_value()) {
            return RegistryError::EXIT_ALREADY_REQUESTED;
          }
          if (eligible(validator)
              and countEligible(validators) <= config_.min_active_validators) {
            SL_WARN(logger_,
                    "Exit of validator {} refused: eligible set would drop "
                    "below {}",
                    id,
                    config_.min_active_validators);
            return RegistryError::VALIDATOR_SET_TOO_SMALL;
          }
          validator.active = false;
          validator.exit_requested_at = now;
          SL_INFO(logger_, "Validator {} requested exit", id);
          return outcome::success();
        });
  }

  outcome::result<Balance> ValidatorRegistryImpl::completeExit(
      const ValidatorId &id) {
    auto now = clock_->now();
    return validators_.exclusiveAccess(
        [&](Validators &validators) -> outcome::result<Balance> {
          auto it = validators.find(id);
          if (it == validators.end()) {
            return RegistryError::UNKNOWN_VALIDATOR;
          }
          const auto &validator = it->second;
          if (not validator.exit_requested_at.has_value()) {
            return RegistryError::EXIT_NOT_REQUESTED;
          }
          if (now < *validator.exit_requested_at + config_.exit_cooldown) {
            return RegistryError::COOLDOWN_NOT_ELAPSED;
          }
          auto stake = validator.stake;
          validators.erase(it);
          SL_INFO(
              logger_, "Validator {} exited, returning stake {}", id, stake);
          return stake;
        });
  }

  bool ValidatorRegistryImpl::isEligible(const ValidatorId &id) const {
    return validators_.sharedAccess([&](const Validators &validators) {
      auto it = validators.find(id);
      return it != validators.end() and eligible(it->second);
    });
  }

  std::optional<Validator> ValidatorRegistryImpl::get(
      const ValidatorId &id) const {
    return validators_.sharedAccess(
        [&](const Validators &validators) -> std::optional<Validator> {
          auto it = validators.find(id);
          if (it == validators.end()) {
            return std::nullopt;
          }
          return it->second;
        });
  }

  std::vector<ValidatorId> ValidatorRegistryImpl::eligibleValidators() const {
    return validators_.sharedAccess([&](const Validators &validators) {
      std::vector<ValidatorId> res;
      for (const auto &[id, validator] : validators) {
        if (eligible(validator)) {
          res.push_back(id);
        }
      }
      std::ranges::sort(res);
      return res;
    });
  }

  size_t ValidatorRegistryImpl::eligibleCount() const {
    return validators_.sharedAccess(
        [&](const Validators &validators) {
          return countEligible(validators);
        });
  }

}  // namespace qbridge::registry
