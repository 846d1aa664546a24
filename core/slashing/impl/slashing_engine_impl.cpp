/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "slashing/impl/slashing_engine_impl.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "slashing/slashing_error.hpp"

namespace qbridge::slashing {

  using primitives::Attestation;
  using primitives::SlashEvent;
  using primitives::SlashId;
  using primitives::SlashReason;
  using primitives::SlashStatus;
  using primitives::TransferId;
  using primitives::ValidatorId;

  SlashingEngineImpl::SlashingEngineImpl(
      Config config,
      std::shared_ptr<registry::ValidatorRegistry> registry,
      std::shared_ptr<registry::ScoringStrategy> scoring,
      std::shared_ptr<crypto::Ed25519Provider> crypto,
      std::shared_ptr<clock::SystemClock> clock,
      std::shared_ptr<alert::AlertSink> alert_sink,
      LockVerifier lock_verifier)
      : config_{config},
        registry_{std::move(registry)},
        scoring_{std::move(scoring)},
        crypto_{std::move(crypto)},
        clock_{std::move(clock)},
        alert_sink_{std::move(alert_sink)},
        lock_verifier_{std::move(lock_verifier)},
        logger_{log::createLogger("SlashingEngine", "slashing")} {
    BOOST_ASSERT(registry_);
    BOOST_ASSERT(scoring_);
    BOOST_ASSERT(crypto_);
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(alert_sink_);
  }

  bool SlashingEngineImpl::verify(const Attestation &attestation) const {
    auto message = primitives::attestationSigningMessage(attestation.payload);
    auto res = crypto_->verify(
        attestation.signature, message, attestation.validator);
    return res.has_value() and res.value();
  }

  void SlashingEngineImpl::notify(const SlashEvent &event) const {
    auto handlers = handlers_.sharedAccess([](const auto &h) { return h; });
    for (const auto &handler : handlers) {
      handler(event);
    }
  }

  void SlashingEngineImpl::subscribe(SlashHandler handler) {
    handlers_.exclusiveAccess(
        [&](auto &handlers) { handlers.emplace_back(std::move(handler)); });
  }

  outcome::result<SlashEvent> SlashingEngineImpl::createPending(
      Record record, std::optional<ReportKey> key) {
    auto now = clock_->now();
    auto res = state_.exclusiveAccess(
        [&](State &state) -> outcome::result<SlashEvent> {
          if (key.has_value() and not state.reported.insert(*key).second) {
            return SlashingError::ALREADY_REPORTED;
          }
          record.event.id = state.next_id++;
          record.event.timestamp = now;
          record.event.dispute_deadline = now + config_.dispute_window;
          record.event.status = SlashStatus::Pending;
          auto event = record.event;
          state.records.emplace(event.id, std::move(record));
          return event;
        });
    OUTCOME_TRY(event, res);
    SL_INFO(logger_,
            "Slash #{} of validator {} for {} opened, disputable until {}s",
            event.id,
            event.validator,
            event.reason,
            std::chrono::duration_cast<std::chrono::seconds>(
                event.dispute_deadline.time_since_epoch())
                .count());
    return event;
  }

  SlashEvent SlashingEngineImpl::apply(SlashEvent event) {
    auto bps = scoring_->slashBasisPoints(event.reason);
    auto slash_res = registry_->slash(event.validator, bps);
    if (slash_res.has_error()) {
      SL_WARN(logger_,
              "Slash #{} could not take stake of validator {}: {}",
              event.id,
              event.validator,
              slash_res.error().message());
    } else {
      event.amount_slashed = slash_res.value().slashed;
    }
    if (auto rep_res = registry_->updateReputation(
            event.validator, scoring_->reputationPenalty(event.reason));
        rep_res.has_error()) {
      SL_WARN(logger_,
              "Slash #{} could not lower reputation of validator {}: {}",
              event.id,
              event.validator,
              rep_res.error().message());
    }
    event.status = SlashStatus::Applied;

    alert_sink_->raise(alert::Alert{
        .type = alert::AlertType::SlashApplied,
        .transfer_id = event.transfer_id,
        .amount = event.amount_slashed,
        .description = fmt::format("Validator {} slashed for {}",
                                   event.validator,
                                   event.reason),
        .at = clock_->now(),
    });
    return event;
  }

  outcome::result<SlashEvent> SlashingEngineImpl::reportEquivocation(
      const Attestation &first, const Attestation &second) {
    if (first.validator != second.validator
        or first.payload.transfer_id != second.payload.transfer_id
        or first.payload == second.payload) {
      return SlashingError::NOT_EQUIVOCATION;
    }
    if (not verify(first) or not verify(second)) {
      return SlashingError::INVALID_SIGNATURE;
    }

    const auto &transfer_id = first.payload.transfer_id;
    auto now = clock_->now();
    auto res = state_.exclusiveAccess(
        [&](State &state) -> outcome::result<SlashEvent> {
          ReportKey key{
              SlashReason::Equivocation, first.validator, transfer_id};
          if (not state.reported.insert(key).second) {
            return SlashingError::ALREADY_REPORTED;
          }
          SlashEvent event{.id = state.next_id++,
                           .validator = first.validator,
                           .reason = SlashReason::Equivocation,
                           .timestamp = now,
                           .dispute_deadline = now,
                           .status = SlashStatus::Applied,
                           .transfer_id = transfer_id};
          state.records.emplace(event.id, Record{.event = event});
          return event;
        });
    OUTCOME_TRY(event, res);

    SL_WARN(logger_,
            "Validator {} equivocated on transfer {}",
            event.validator,
            transfer_id);
    alert_sink_->raise(alert::Alert{
        .type = alert::AlertType::Equivocation,
        .transfer_id = transfer_id,
        .description = fmt::format(
            "Validator {} signed conflicting attestations", event.validator),
        .at = now,
    });

    event = apply(event);
    state_.exclusiveAccess(
        [&](State &state) { state.records.at(event.id).event = event; });
    notify(event);
    return event;
  }

  outcome::result<SlashEvent> SlashingEngineImpl::reportNonParticipation(
      const ValidatorId &validator, std::vector<TransferId> missed) {
    std::optional<TransferId> last;
    if (not missed.empty()) {
      last = missed.back();
    }
    Record record{.event = {.validator = validator,
                            .reason = SlashReason::NonParticipation,
                            .transfer_id = last},
                  .missed = std::move(missed)};
    OUTCOME_TRY(event, createPending(std::move(record), std::nullopt));
    notify(event);
    return event;
  }

  outcome::result<SlashEvent> SlashingEngineImpl::reportInvalidAttestation(
      const Attestation &attestation) {
    if (not verify(attestation)) {
      return SlashingError::INVALID_SIGNATURE;
    }
    OUTCOME_TRY(
        event,
        createPending(
            Record{.event = {.validator = attestation.validator,
                             .reason = SlashReason::InvalidAttestation,
                             .transfer_id = attestation.payload.transfer_id},
                   .accused = attestation},
            ReportKey{SlashReason::InvalidAttestation,
                      attestation.validator,
                      attestation.payload.transfer_id}));
    notify(event);
    return event;
  }

  void SlashingEngineImpl::recordParticipation(
      const TransferId &transfer_id,
      const std::vector<ValidatorId> &eligible,
      const std::vector<ValidatorId> &attested,
      bool expired) {
    std::vector<std::pair<ValidatorId, std::vector<TransferId>>> offenders;
    state_.exclusiveAccess([&](State &state) {
      for (const auto &validator : attested) {
        state.misses.erase(validator);
      }
      if (not expired) {
        return;
      }
      for (const auto &validator : eligible) {
        if (std::ranges::find(attested, validator) != attested.end()) {
          continue;
        }
        auto &misses = state.misses[validator];
        ++misses.consecutive;
        misses.transfers.push_back(transfer_id);
        SL_DEBUG(logger_,
                 "Validator {} missed transfer {} ({} in a row)",
                 validator,
                 transfer_id,
                 misses.consecutive);
        if (misses.consecutive >= config_.missed_window_limit) {
          offenders.emplace_back(validator, std::move(misses.transfers));
          state.misses.erase(validator);
        }
      }
    });

    for (auto &[validator, missed] : offenders) {
      if (auto res = reportNonParticipation(validator, std::move(missed));
          res.has_error()) {
        SL_ERROR(logger_,
                 "Non-participation of validator {} not reported: {}",
                 validator,
                 res.error().message());
      }
    }
  }

  size_t SlashingEngineImpl::missedWindows(const ValidatorId &validator) const {
    return state_.sharedAccess([&](const State &state) -> size_t {
      auto it = state.misses.find(validator);
      return it == state.misses.end() ? 0 : it->second.consecutive;
    });
  }

  outcome::result<SlashEvent> SlashingEngineImpl::submitCounterEvidence(
      SlashId slash_id, const CounterEvidence &evidence) {
    auto record_res =
        state_.sharedAccess([&](const State &state) -> outcome::result<Record> {
          auto it = state.records.find(slash_id);
          if (it == state.records.end()) {
            return SlashingError::UNKNOWN_SLASH;
          }
          return it->second;
        });
    OUTCOME_TRY(record, record_res);

    if (record.event.status != SlashStatus::Pending) {
      return SlashingError::NOT_PENDING;
    }
    if (clock_->now() > record.event.dispute_deadline) {
      return SlashingError::DISPUTE_WINDOW_CLOSED;
    }

    bool refuted = false;
    if (const auto *attestation = std::get_if<Attestation>(&evidence)) {
      refuted = record.event.reason == SlashReason::NonParticipation
            and attestation->validator == record.event.validator
            and std::ranges::find(record.missed,
                                  attestation->payload.transfer_id)
                    != record.missed.end()
            and verify(*attestation);
    } else if (const auto *lock =
                   std::get_if<primitives::LockEvent>(&evidence)) {
      if (record.event.reason == SlashReason::InvalidAttestation
          and record.accused.has_value()
          and primitives::AttestationPayload::fromLock(*lock)
                  == record.accused->payload
          and lock_verifier_) {
        OUTCOME_TRY(confirmed, lock_verifier_(*lock));
        refuted = confirmed;
      }
    }

    if (not refuted) {
      SL_DEBUG(logger_, "Counter-evidence for slash #{} rejected", slash_id);
      return SlashingError::EVIDENCE_REJECTED;
    }
    SL_INFO(logger_, "Slash #{} refuted by counter-evidence", slash_id);
    return markOverturned(slash_id, true);
  }

  outcome::result<SlashEvent> SlashingEngineImpl::overturn(SlashId slash_id) {
    return markOverturned(slash_id, false);
  }

  outcome::result<SlashEvent> SlashingEngineImpl::markOverturned(
      SlashId slash_id, bool require_open_window) {
    auto now = clock_->now();
    auto res = state_.exclusiveAccess(
        [&](State &state) -> outcome::result<SlashEvent> {
          auto it = state.records.find(slash_id);
          if (it == state.records.end()) {
            return SlashingError::UNKNOWN_SLASH;
          }
          auto &event = it->second.event;
          if (event.status != SlashStatus::Pending) {
            return SlashingError::NOT_PENDING;
          }
          if (require_open_window and now > event.dispute_deadline) {
            return SlashingError::DISPUTE_WINDOW_CLOSED;
          }
          event.status = SlashStatus::Overturned;
          return event;
        });
    OUTCOME_TRY(event, res);
    SL_INFO(logger_,
            "Slash #{} of validator {} overturned",
            event.id,
            event.validator);
    notify(event);
    return event;
  }

  std::vector<SlashEvent> SlashingEngineImpl::finalizeMatured() {
    auto now = clock_->now();
    auto matured = state_.exclusiveAccess([&](State &state) {
      std::vector<SlashEvent> res;
      for (auto &[id, record] : state.records) {
        auto &event = record.event;
        if (event.status == SlashStatus::Pending
            and event.dispute_deadline <= now) {
          // claimed here, stake is taken outside of the lock
          event.status = SlashStatus::Applied;
          res.push_back(event);
        }
      }
      return res;
    });

    for (auto &event : matured) {
      event = apply(event);
      state_.exclusiveAccess(
          [&](State &state) { state.records.at(event.id).event = event; });
      SL_INFO(logger_,
              "Slash #{} of validator {} applied after dispute window, {} "
              "taken",
              event.id,
              event.validator,
              event.amount_slashed);
      notify(event);
    }
    return matured;
  }

  std::optional<SlashEvent> SlashingEngineImpl::get(SlashId slash_id) const {
    return state_.sharedAccess(
        [&](const State &state) -> std::optional<SlashEvent> {
          auto it = state.records.find(slash_id);
          if (it == state.records.end()) {
            return std::nullopt;
          }
          return it->second.event;
        });
  }

  std::vector<SlashEvent> SlashingEngineImpl::events() const {
    return state_.sharedAccess([](const State &state) {
      std::vector<SlashEvent> res;
      res.reserve(state.records.size());
      for (const auto &[_, record] : state.records) {
        res.push_back(record.event);
      }
      return res;
    });
  }

}  // namespace qbridge::slashing
