/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/impl/attestation_aggregator_impl.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "attestation/aggregator_error.hpp"

namespace qbridge::attestation {

  using primitives::Attestation;
  using primitives::TransferId;
  using primitives::ValidatorId;

  AttestationAggregatorImpl::AttestationAggregatorImpl(
      std::shared_ptr<registry::ValidatorRegistry> registry,
      std::shared_ptr<slashing::SlashingEngine> slashing,
      std::shared_ptr<replay::ReplayGuard> replay_guard,
      std::shared_ptr<crypto::Ed25519Provider> crypto,
      std::shared_ptr<clock::SystemClock> clock)
      : registry_{std::move(registry)},
        slashing_{std::move(slashing)},
        replay_guard_{std::move(replay_guard)},
        crypto_{std::move(crypto)},
        clock_{std::move(clock)},
        logger_{log::createLogger("AttestationAggregator", "attestation")} {
    BOOST_ASSERT(registry_);
    BOOST_ASSERT(slashing_);
    BOOST_ASSERT(replay_guard_);
    BOOST_ASSERT(crypto_);
    BOOST_ASSERT(clock_);
  }

  std::shared_ptr<AttestationAggregatorImpl::Round>
  AttestationAggregatorImpl::round(const TransferId &id) const {
    return rounds_.sharedAccess(
        [&](const auto &rounds) -> std::shared_ptr<Round> {
          auto it = rounds.find(id);
          return it == rounds.end() ? nullptr : it->second;
        });
  }

  bool AttestationAggregatorImpl::verify(const Attestation &attestation) const {
    auto message = primitives::attestationSigningMessage(attestation.payload);
    auto res = crypto_->verify(
        attestation.signature, message, attestation.validator);
    if (res.has_error()) {
      SL_WARN(logger_,
              "Signature of validator {} not verified: {}",
              attestation.validator,
              res.error().message());
      return false;
    }
    return res.value();
  }

  outcome::result<void> AttestationAggregatorImpl::open(
      const primitives::AttestationPayload &expected,
      uint32_t threshold,
      clock::TimePoint deadline) {
    auto round = std::make_shared<Round>();
    round->expected = expected;
    round->threshold = threshold;
    round->deadline = deadline;
    auto inserted = rounds_.exclusiveAccess([&](auto &rounds) {
      return rounds.emplace(expected.transfer_id, std::move(round)).second;
    });
    if (not inserted) {
      return AggregatorError::ROUND_ALREADY_OPEN;
    }
    SL_DEBUG(logger_,
             "Round for transfer {} opened, threshold {}",
             expected.transfer_id,
             threshold);
    return outcome::success();
  }

  outcome::result<AttestationOutcome> AttestationAggregatorImpl::submit(
      const Attestation &attestation) {
    const auto &transfer_id = attestation.payload.transfer_id;
    const auto &validator = attestation.validator;

    if (replay_guard_->isSettled(transfer_id)) {
      SL_DEBUG(logger_,
               "Attestation of {} for settled transfer {} ignored",
               validator,
               transfer_id);
      return AttestationOutcome::Ignored;
    }

    auto round = this->round(transfer_id);
    if (not round) {
      return AggregatorError::UNKNOWN_TRANSFER;
    }

    if (not verify(attestation)) {
      SL_DEBUG(logger_,
               "Attestation of {} for transfer {} has invalid signature",
               validator,
               transfer_id);
      return AggregatorError::INVALID_SIGNATURE;
    }

    auto now = clock_->now();
    std::optional<Attestation> conflicting;
    bool mismatch = false;
    auto res = [&]() -> outcome::result<AttestationOutcome> {
      std::lock_guard lock{round->mutex};

      if (round->closed or now > round->deadline) {
        SL_DEBUG(logger_,
                 "Attestation of {} for transfer {} arrived after the round "
                 "closed",
                 validator,
                 transfer_id);
        return AttestationOutcome::Ignored;
      }

      if (auto it = round->first_seen.find(validator);
          it != round->first_seen.end()) {
        if (it->second.payload == attestation.payload) {
          return AttestationOutcome::Duplicate;
        }
        conflicting = it->second;
        return AggregatorError::EQUIVOCATION;
      }

      // eligibility is checked at acceptance time, not at signing time
      if (not registry_->isEligible(validator)) {
        return AggregatorError::INELIGIBLE_VALIDATOR;
      }

      round->first_seen.emplace(validator, attestation);

      if (attestation.payload != round->expected) {
        mismatch = true;
        return AggregatorError::PAYLOAD_MISMATCH;
      }

      round->accepted.push_back(attestation);
      if (not round->threshold_reported
          and round->accepted.size() >= round->threshold) {
        round->threshold_reported = true;
        return AttestationOutcome::ThresholdReached;
      }
      return AttestationOutcome::Accepted;
    }();

    // collaborators are called outside of the round lock
    if (conflicting.has_value()) {
      SL_WARN(logger_,
              "Validator {} equivocated on transfer {}",
              validator,
              transfer_id);
      if (auto slash_res =
              slashing_->reportEquivocation(*conflicting, attestation);
          slash_res.has_error()) {
        SL_DEBUG(logger_,
                 "Equivocation of {} not slashed: {}",
                 validator,
                 slash_res.error().message());
      }
    } else if (mismatch) {
      SL_WARN(logger_,
              "Validator {} attested a payload different from the lock of "
              "transfer {}",
              validator,
              transfer_id);
      if (auto slash_res = slashing_->reportInvalidAttestation(attestation);
          slash_res.has_error()) {
        SL_DEBUG(logger_,
                 "Invalid attestation of {} not reported: {}",
                 validator,
                 slash_res.error().message());
      }
    }

    if (res.has_value()
        and (res.value() == AttestationOutcome::Accepted
             or res.value() == AttestationOutcome::ThresholdReached)) {
      if (auto rec_res = registry_->recordAttestation(validator);
          rec_res.has_error()) {
        SL_DEBUG(logger_,
                 "Activity of {} not recorded: {}",
                 validator,
                 rec_res.error().message());
      }
      SL_DEBUG(logger_,
               "Attestation of {} for transfer {}: {}",
               validator,
               transfer_id,
               res.value());
    }
    return res;
  }

  void AttestationAggregatorImpl::close(const TransferId &transfer_id) {
    if (auto round = this->round(transfer_id)) {
      std::lock_guard lock{round->mutex};
      round->closed = true;
    }
  }

  void AttestationAggregatorImpl::remove(const TransferId &transfer_id) {
    rounds_.exclusiveAccess([&](auto &rounds) { rounds.erase(transfer_id); });
  }

  bool AttestationAggregatorImpl::revoke(const TransferId &transfer_id,
                                         const ValidatorId &validator) {
    auto round = this->round(transfer_id);
    if (not round) {
      return false;
    }
    std::lock_guard lock{round->mutex};
    auto removed = std::erase_if(round->accepted, [&](const Attestation &a) {
      return a.validator == validator;
    });
    if (round->accepted.size() < round->threshold) {
      round->threshold_reported = false;
    }
    if (removed > 0) {
      SL_INFO(logger_,
              "Attestation of {} for transfer {} revoked, {} of {} remain",
              validator,
              transfer_id,
              round->accepted.size(),
              round->threshold);
    }
    return removed > 0;
  }

  std::optional<primitives::ProofBundle> AttestationAggregatorImpl::proof(
      const TransferId &transfer_id) const {
    auto round = this->round(transfer_id);
    if (not round) {
      return std::nullopt;
    }
    std::lock_guard lock{round->mutex};
    if (round->accepted.size() < round->threshold) {
      return std::nullopt;
    }
    primitives::ProofBundle bundle{.transfer_id = transfer_id};
    bundle.attestations.assign(round->accepted.begin(),
                               round->accepted.begin() + round->threshold);
    std::ranges::sort(bundle.attestations,
                      [](const Attestation &lhs, const Attestation &rhs) {
                        return lhs.validator < rhs.validator;
                      });
    return bundle;
  }

  std::vector<Attestation> AttestationAggregatorImpl::attestations(
      const TransferId &transfer_id) const {
    auto round = this->round(transfer_id);
    if (not round) {
      return {};
    }
    std::lock_guard lock{round->mutex};
    return round->accepted;
  }

  size_t AttestationAggregatorImpl::count(const TransferId &transfer_id) const {
    auto round = this->round(transfer_id);
    if (not round) {
      return 0;
    }
    std::lock_guard lock{round->mutex};
    return round->accepted.size();
  }

}  // namespace qbridge::attestation
