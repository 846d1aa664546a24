/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/impl/transfer_state_machine_impl.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "attestation/aggregator_error.hpp"
#include "transfer/transfer_error.hpp"

namespace qbridge::transfer {

  using attestation::AttestationOutcome;
  using primitives::Attestation;
  using primitives::ChainConfig;
  using primitives::DisputeCause;
  using primitives::LockEvent;
  using primitives::SlashEvent;
  using primitives::SlashReason;
  using primitives::SlashStatus;
  using primitives::Transfer;
  using primitives::TransferId;
  using primitives::TransferStatus;
  using primitives::TxHash;
  using primitives::ValidatorId;

  namespace {
    bool contains(const std::vector<ValidatorId> &validators,
                  const ValidatorId &validator) {
      return std::ranges::find(validators, validator) != validators.end();
    }

    /// Adapter keeps submitting and reports a final failure to observers
    bool retriedInBackground(const std::error_code &error) {
      return error == chain::ChainSubmissionError::RETRY_SCHEDULED
          or error == chain::ChainSubmissionError::IN_PROGRESS;
    }
  }  // namespace

  TransferStateMachineImpl::TransferStateMachineImpl(
      Config config,
      std::shared_ptr<chain::ChainConfigStore> configs,
      std::shared_ptr<chain::ChainAdapters> adapters,
      std::shared_ptr<fee::FeeCalculator> fee_calculator,
      std::shared_ptr<attestation::AttestationAggregator> aggregator,
      std::shared_ptr<registry::ValidatorRegistry> registry,
      std::shared_ptr<slashing::SlashingEngine> slashing,
      std::shared_ptr<replay::ReplayGuard> replay_guard,
      std::shared_ptr<alert::AlertSink> alert_sink,
      std::shared_ptr<clock::SystemClock> clock,
      clock::TimerFactory timer_factory)
      : config_{config},
        configs_{std::move(configs)},
        adapters_{std::move(adapters)},
        fee_calculator_{std::move(fee_calculator)},
        aggregator_{std::move(aggregator)},
        registry_{std::move(registry)},
        slashing_{std::move(slashing)},
        replay_guard_{std::move(replay_guard)},
        alert_sink_{std::move(alert_sink)},
        clock_{std::move(clock)},
        timer_factory_{std::move(timer_factory)},
        logger_{log::createLogger("TransferStateMachine", "transfer")} {
    BOOST_ASSERT(configs_);
    BOOST_ASSERT(adapters_);
    BOOST_ASSERT(fee_calculator_);
    BOOST_ASSERT(aggregator_);
    BOOST_ASSERT(registry_);
    BOOST_ASSERT(slashing_);
    BOOST_ASSERT(replay_guard_);
    BOOST_ASSERT(alert_sink_);
    BOOST_ASSERT(clock_);
  }

  std::shared_ptr<TransferStateMachineImpl::Entry>
  TransferStateMachineImpl::entry(const TransferId &id) const {
    return transfers_.sharedAccess(
        [&](const auto &transfers) -> std::shared_ptr<Entry> {
          auto it = transfers.find(id);
          return it == transfers.end() ? nullptr : it->second;
        });
  }

  std::vector<std::shared_ptr<TransferStateMachineImpl::Entry>>
  TransferStateMachineImpl::entries() const {
    return transfers_.sharedAccess([](const auto &transfers) {
      std::vector<std::shared_ptr<Entry>> res;
      res.reserve(transfers.size());
      for (const auto &[_, entry] : transfers) {
        res.push_back(entry);
      }
      return res;
    });
  }

  void TransferStateMachineImpl::raise(alert::AlertType type,
                                       const TransferId &transfer_id,
                                       primitives::Balance amount,
                                       std::string description) {
    alert_sink_->raise(alert::Alert{.type = type,
                                    .transfer_id = transfer_id,
                                    .amount = amount,
                                    .description = std::move(description),
                                    .at = clock_->now()});
  }

  bool TransferStateMachineImpl::transit(Transfer &transfer,
                                         TransferStatus next,
                                         std::string note) {
    if (not replay_guard_->admit(transfer.id, next)) {
      return false;
    }
    SL_INFO(logger_,
            "Transfer {}: {} -> {} ({})",
            transfer.id,
            transfer.status,
            next,
            note);
    transfer.status = next;
    transfer.history.push_back({next, clock_->now(), std::move(note)});
    return true;
  }

  void TransferStateMachineImpl::refreshAttestations(Transfer &transfer) const {
    switch (transfer.status) {
      case TransferStatus::Confirmed:
      case TransferStatus::Attesting:
      case TransferStatus::Disputed:
        break;
      default:
        return;
    }
    auto attestations = aggregator_->attestations(transfer.id);
    transfer.attestations.clear();
    for (const auto &attestation : attestations) {
      transfer.attestations.push_back(attestation.validator);
    }
  }

  std::optional<std::string> TransferStateMachineImpl::checkLock(
      const LockEvent &lock,
      const std::shared_ptr<const ChainConfig> &source,
      const std::shared_ptr<const ChainConfig> &dest) const {
    if (not source) {
      return fmt::format("source chain #{} is not bridged", lock.source_chain);
    }
    if (not dest) {
      return fmt::format("destination chain #{} is not bridged",
                         lock.dest_chain);
    }
    if (lock.source_chain == lock.dest_chain) {
      return std::string{"source and destination chains coincide"};
    }
    if (not primitives::canSend(source->role)) {
      return fmt::format("chain #{} only receives", source->chain_id);
    }
    if (not primitives::canReceive(dest->role)) {
      return fmt::format("chain #{} only sends", dest->chain_id);
    }
    if (lock.amount < source->min_amount or lock.amount > source->max_amount) {
      return fmt::format("amount {} is out of [{}, {}]",
                         lock.amount,
                         source->min_amount,
                         source->max_amount);
    }
    return std::nullopt;
  }

  std::shared_ptr<TransferStateMachineImpl::Entry>
  TransferStateMachineImpl::create(const LockEvent &lock) {
    auto id = lock.transferId();
    if (auto existing = entry(id)) {
      return existing;
    }
    if (replay_guard_->isSettled(id)) {
      SL_DEBUG(logger_, "Lock of forgotten settled transfer {} ignored", id);
      return nullptr;
    }

    auto now = clock_->now();
    auto source = configs_->get(lock.source_chain);
    auto dest = configs_->get(lock.dest_chain);

    auto fresh = std::make_shared<Entry>();
    auto &t = fresh->transfer;
    t.id = id;
    t.source_chain = lock.source_chain;
    t.dest_chain = lock.dest_chain;
    t.sender = lock.sender;
    t.recipient = lock.recipient;
    t.amount = lock.amount;
    t.nonce = lock.nonce;
    t.fee = source ? fee_calculator_->transferFee(*source, lock.amount) : 0;
    t.threshold = dest ? dest->attestation_threshold : 0;
    t.created_at = now;
    t.expires_at = now + (source ? source->validation_timeout
                                 : std::chrono::seconds::zero());
    t.lock_tx = lock.tx_hash;
    t.source_config = source;
    t.dest_config = dest;
    t.history.push_back({TransferStatus::Initiated, now, "lock observed"});

    // published locked, nobody sees the transfer before it is checked
    std::lock_guard guard{fresh->mutex};
    auto [stored, inserted] = transfers_.exclusiveAccess([&](auto &transfers) {
      auto [it, inserted] = transfers.emplace(id, fresh);
      return std::make_pair(it->second, inserted);
    });
    if (not inserted) {
      return stored;
    }

    if (auto reason = checkLock(lock, source, dest)) {
      // value stays locked, so the sender gets the refund path at once
      SL_WARN(logger_, "Lock of transfer {} refused: {}", id, *reason);
      if (transit(t, TransferStatus::Expired, *reason)) {
        t.refund_available_at = now;
      }
      return stored;
    }
    SL_INFO(logger_,
            "Transfer {} initiated: {} from chain #{} to chain #{}, fee {}",
            id,
            t.amount,
            t.source_chain,
            t.dest_chain,
            t.fee);
    armDeadline(*stored);
    return stored;
  }

  void TransferStateMachineImpl::armDeadline(Entry &entry) {
    if (not timer_factory_) {
      return;
    }
    entry.deadline_timer = timer_factory_();
    if (not entry.deadline_timer) {
      return;
    }
    entry.deadline_timer->expiresAt(entry.transfer.expires_at);
    entry.deadline_timer->asyncWait(
        [weak{weak_from_this()},
         id{entry.transfer.id}](const boost::system::error_code &ec) {
          if (ec) {
            return;
          }
          if (auto self = weak.lock()) {
            self->onDeadline(id);
          }
        });
  }

  void TransferStateMachineImpl::onDeadline(const TransferId &transfer_id) {
    auto e = entry(transfer_id);
    if (not e) {
      return;
    }
    std::optional<Expiry> expiry;
    {
      std::lock_guard guard{e->mutex};
      expiry = expireLocked(*e, clock_->now());
    }
    if (expiry) {
      completeExpiry(*expiry);
    }
  }

  void TransferStateMachineImpl::onLockObserved(const LockEvent &lock) {
    create(lock);
  }

  void TransferStateMachineImpl::onLockConfirmed(const LockEvent &lock) {
    auto e = create(lock);
    if (not e) {
      return;
    }
    std::lock_guard guard{e->mutex};
    auto &t = e->transfer;
    if (t.status != TransferStatus::Initiated) {
      SL_TRACE(logger_,
               "Confirmation of transfer {} ignored: {}",
               t.id,
               t.status);
      return;
    }
    if (t.recipient != lock.recipient or t.amount != lock.amount
        or t.dest_chain != lock.dest_chain or t.lock_tx != lock.tx_hash) {
      SL_ERROR(logger_,
               "Confirmed lock differs from the observed one of transfer {}",
               t.id);
      return;
    }
    if (clock_->now() >= t.expires_at) {
      return;
    }
    if (not transit(t, TransferStatus::Confirmed, "lock confirmed")) {
      return;
    }
    auto opened =
        aggregator_->open(primitives::AttestationPayload::fromLock(lock),
                          t.threshold,
                          t.expires_at);
    if (opened.has_error()) {
      SL_WARN(logger_,
              "Round of transfer {} not opened: {}",
              t.id,
              opened.error().message());
    }
    transit(t, TransferStatus::Attesting, "collecting attestations");
  }

  void TransferStateMachineImpl::onLockDropped(const LockEvent &lock) {
    auto id = lock.transferId();
    auto e = entry(id);
    if (not e) {
      return;
    }
    std::lock_guard guard{e->mutex};
    const auto &t = e->transfer;
    if (t.status != TransferStatus::Initiated or t.lock_tx != lock.tx_hash) {
      SL_DEBUG(logger_, "Dropped lock of transfer {} ignored: {}", id, t.status);
      return;
    }
    if (e->deadline_timer) {
      e->deadline_timer->cancel();
    }
    // nothing is locked on the ledger, so there is nothing to refund
    transfers_.exclusiveAccess([&](auto &transfers) {
      if (auto it = transfers.find(id);
          it != transfers.end() and it->second == e) {
        transfers.erase(it);
      }
    });
    SL_WARN(logger_,
            "Lock of transfer {} was reorganized away, transfer dropped",
            id);
  }

  void TransferStateMachineImpl::onMintConfirmed(const TransferId &transfer_id,
                                                 const TxHash &tx_hash) {
    auto e = entry(transfer_id);
    if (not e) {
      SL_WARN(logger_, "Mint {} of unknown transfer {}", tx_hash, transfer_id);
      return;
    }
    {
      std::lock_guard guard{e->mutex};
      auto &t = e->transfer;
      if (t.status != TransferStatus::Finalized) {
        SL_DEBUG(logger_,
                 "Mint confirmation of transfer {} ignored: {}",
                 transfer_id,
                 t.status);
        return;
      }
      if (not transit(t, TransferStatus::Completed, "mint confirmed")) {
        return;
      }
      t.mint_tx = tx_hash;
      t.completed_at = clock_->now();
      t.requires_operator = false;
    }
    aggregator_->remove(transfer_id);
  }

  void TransferStateMachineImpl::onSubmissionFailed(
      const TransferId &transfer_id, std::error_code error) {
    auto e = entry(transfer_id);
    if (not e) {
      return;
    }
    std::lock_guard guard{e->mutex};
    auto &t = e->transfer;
    auto minting = t.status == TransferStatus::Finalized and not t.mint_tx;
    if (not minting and t.status != TransferStatus::Expired) {
      return;
    }
    auto what = minting ? "mint" : "refund";
    auto chain_id = minting ? t.dest_chain : t.source_chain;
    t.requires_operator = true;
    t.history.push_back(
        {t.status,
         clock_->now(),
         fmt::format("{} submission failed: {}", what, error.message())});
    SL_ERROR(logger_,
             "Background {} of transfer {} failed: {}",
             what,
             t.id,
             error.message());
    raise(alert::AlertType::ChainSubmissionFailure,
          t.id,
          t.amount,
          fmt::format(
              "{} on chain #{} failed: {}", what, chain_id, error.message()));
  }

  outcome::result<AttestationOutcome>
  TransferStateMachineImpl::submitAttestation(const Attestation &attestation) {
    auto e = entry(attestation.payload.transfer_id);
    if (not e) {
      return attestation::AggregatorError::UNKNOWN_TRANSFER;
    }

    OUTCOME_TRY(result, aggregator_->submit(attestation));

    if (result == AttestationOutcome::Accepted
        or result == AttestationOutcome::ThresholdReached) {
      std::optional<Finalization> finalization;
      {
        std::lock_guard guard{e->mutex};
        refreshAttestations(e->transfer);
        finalization = finalizeLocked(*e);
      }
      if (finalization) {
        completeFinalization(*finalization);
      }
    }
    return result;
  }

  std::optional<TransferStateMachineImpl::Finalization>
  TransferStateMachineImpl::finalizeLocked(Entry &entry) {
    auto &t = entry.transfer;
    if (t.status != TransferStatus::Attesting) {
      return std::nullopt;
    }
    auto proof = aggregator_->proof(t.id);
    if (not proof) {
      return std::nullopt;
    }
    if (paused_) {
      if (not t.held) {
        t.held = true;
        SL_INFO(logger_,
                "Transfer {} reached threshold while paused, held",
                t.id);
      }
      return std::nullopt;
    }
    refreshAttestations(t);
    if (not transit(
            t, TransferStatus::Finalized, "attestation threshold met")) {
      return std::nullopt;
    }
    t.held = false;
    aggregator_->close(t.id);
    if (entry.deadline_timer) {
      entry.deadline_timer->cancel();
    }
    if (auto res = submitMint(t, std::move(proof.value())); res.has_error()) {
      SL_DEBUG(logger_, "Transfer {} waits for an operator", t.id);
    }
    return Finalization{.id = t.id, .attested = t.attestations};
  }

  void TransferStateMachineImpl::completeFinalization(
      const Finalization &finalization) {
    slashing_->recordParticipation(
        finalization.id, {}, finalization.attested, false);
  }

  outcome::result<TxHash> TransferStateMachineImpl::submitMint(
      Transfer &transfer, primitives::ProofBundle proof) {
    auto adapter = adapters_->get(transfer.dest_chain);
    if (not adapter) {
      transfer.requires_operator = true;
      raise(alert::AlertType::ChainSubmissionFailure,
            transfer.id,
            transfer.amount,
            fmt::format("no adapter for chain #{}", transfer.dest_chain));
      return TransferError::NO_ADAPTER;
    }

    primitives::MintOrder order{.transfer_id = transfer.id,
                                .dest_chain = transfer.dest_chain,
                                .recipient = transfer.recipient,
                                .amount = transfer.mintAmount(),
                                .proof = std::move(proof)};
    auto res = adapter->submitMint(order);
    if (res.has_error() and retriedInBackground(res.error())) {
      transfer.history.push_back(
          {transfer.status,
           clock_->now(),
           fmt::format("mint submission pending: {}", res.error().message())});
      SL_INFO(logger_,
              "Mint of transfer {} is retried in the background",
              transfer.id);
      return res.error();
    }
    if (res.has_error()) {
      transfer.requires_operator = true;
      transfer.history.push_back(
          {transfer.status,
           clock_->now(),
           fmt::format("mint submission failed: {}", res.error().message())});
      SL_ERROR(logger_,
               "Mint of transfer {} failed: {}",
               transfer.id,
               res.error().message());
      raise(alert::AlertType::ChainSubmissionFailure,
            transfer.id,
            transfer.amount,
            fmt::format("mint on chain #{} failed: {}",
                        transfer.dest_chain,
                        res.error().message()));
      return res.error();
    }
    transfer.requires_operator = false;
    transfer.mint_tx = res.value();
    transfer.history.push_back(
        {transfer.status,
         clock_->now(),
         fmt::format("mint of {} submitted", order.amount)});
    return res.value();
  }

  std::optional<TransferStateMachineImpl::Expiry>
  TransferStateMachineImpl::expireLocked(Entry &entry, clock::TimePoint now) {
    auto &t = entry.transfer;
    switch (t.status) {
      case TransferStatus::Initiated:
      case TransferStatus::Confirmed:
      case TransferStatus::Attesting:
        break;
      default:
        return std::nullopt;
    }
    if (now < t.expires_at or t.held) {
      return std::nullopt;
    }
    auto window_opened = t.status != TransferStatus::Initiated;
    aggregator_->close(t.id);
    refreshAttestations(t);
    if (not transit(t,
                    TransferStatus::Expired,
                    fmt::format("{} of {} attestations before deadline",
                                t.attestations.size(),
                                t.threshold))) {
      return std::nullopt;
    }
    auto grace = t.source_config ? t.source_config->refund_grace_period
                                 : std::chrono::seconds::zero();
    t.refund_available_at = t.expires_at + grace;
    if (entry.deadline_timer) {
      entry.deadline_timer->cancel();
    }
    return Expiry{.id = t.id,
                  .amount = t.amount,
                  .attestation_window_opened = window_opened,
                  .attested = t.attestations};
  }

  void TransferStateMachineImpl::completeExpiry(const Expiry &expiry) {
    if (expiry.attestation_window_opened) {
      slashing_->recordParticipation(
          expiry.id, registry_->eligibleValidators(), expiry.attested, true);
    }
    raise(alert::AlertType::ConsensusTimeout,
          expiry.id,
          expiry.amount,
          fmt::format("threshold not met, {} attestations collected",
                      expiry.attested.size()));
  }

  std::vector<TransferId> TransferStateMachineImpl::expireOverdue() {
    auto now = clock_->now();
    std::vector<TransferId> expired;
    for (const auto &e : entries()) {
      std::optional<Expiry> expiry;
      {
        std::lock_guard guard{e->mutex};
        expiry = expireLocked(*e, now);
      }
      if (expiry) {
        completeExpiry(*expiry);
        expired.push_back(expiry->id);
      }
    }
    return expired;
  }

  size_t TransferStateMachineImpl::reportUnresolvedDisputes() {
    auto now = clock_->now();
    std::vector<std::pair<TransferId, primitives::Balance>> overdue;
    for (const auto &e : entries()) {
      std::lock_guard guard{e->mutex};
      const auto &t = e->transfer;
      if (t.status == TransferStatus::Disputed and t.dispute_deadline
          and now >= *t.dispute_deadline) {
        overdue.emplace_back(t.id, t.amount);
      }
    }
    for (const auto &[id, amount] : overdue) {
      raise(alert::AlertType::DisputeUnresolved,
            id,
            amount,
            "dispute awaits adjudication past its deadline");
    }
    return overdue.size();
  }

  outcome::result<TxHash> TransferStateMachineImpl::refund(
      const TransferId &transfer_id) {
    auto e = entry(transfer_id);
    if (not e) {
      return TransferError::UNKNOWN_TRANSFER;
    }
    auto now = clock_->now();
    TxHash refund_tx;
    {
      std::lock_guard guard{e->mutex};
      auto &t = e->transfer;
      if (t.status == TransferStatus::Refunded and t.refund_tx) {
        return *t.refund_tx;
      }
      if (t.status != TransferStatus::Expired or not t.refund_available_at
          or now < *t.refund_available_at) {
        return TransferError::REFUND_NOT_AVAILABLE;
      }

      auto adapter = adapters_->get(t.source_chain);
      if (not adapter) {
        t.requires_operator = true;
        return TransferError::NO_ADAPTER;
      }
      auto res = adapter->submitRefund(t.id);
      if (res.has_error() and retriedInBackground(res.error())) {
        SL_INFO(logger_,
                "Refund of transfer {} is retried in the background",
                t.id);
        return res.error();
      }
      if (res.has_error()) {
        t.requires_operator = true;
        SL_ERROR(logger_,
                 "Refund of transfer {} failed: {}",
                 t.id,
                 res.error().message());
        raise(alert::AlertType::ChainSubmissionFailure,
              t.id,
              t.amount,
              fmt::format("refund on chain #{} failed: {}",
                          t.source_chain,
                          res.error().message()));
        return res.error();
      }
      if (not transit(t, TransferStatus::Refunded, "refund submitted")) {
        return TransferError::REPLAY;
      }
      t.refund_tx = res.value();
      t.requires_operator = false;
      refund_tx = res.value();
    }
    aggregator_->remove(transfer_id);
    return refund_tx;
  }

  std::vector<std::shared_ptr<TransferStateMachineImpl::Entry>>
  TransferStateMachineImpl::implicatedBy(const SlashEvent &event) const {
    if (not event.transfer_id) {
      return entries();
    }
    if (auto e = entry(*event.transfer_id)) {
      return {e};
    }
    return {};
  }

  void TransferStateMachineImpl::onSlash(const SlashEvent &event) {
    if (event.reason == SlashReason::NonParticipation) {
      return;
    }
    auto now = clock_->now();
    auto caused = [&](const DisputeCause &cause) {
      return cause.slash == event.id;
    };

    if (event.status == SlashStatus::Overturned) {
      for (const auto &e : implicatedBy(event)) {
        std::optional<Resumption> resumption;
        {
          std::lock_guard guard{e->mutex};
          auto &t = e->transfer;
          if (t.status != TransferStatus::Disputed
              or std::erase_if(t.disputes, caused) == 0) {
            continue;
          }
          if (t.disputes.empty()) {
            resumption = resumeLocked(*e, DisputeResolution::Release, now);
          } else {
            SL_INFO(logger_,
                    "Slash #{} overturned, transfer {} stays disputed by {} "
                    "more",
                    event.id,
                    t.id,
                    t.disputes.size());
          }
        }
        if (resumption) {
          completeResumption(*resumption);
        }
      }
      return;
    }

    std::vector<std::pair<TransferId, primitives::Balance>> opened;
    for (const auto &e : implicatedBy(event)) {
      std::lock_guard guard{e->mutex};
      auto &t = e->transfer;
      if (t.status != TransferStatus::Confirmed
          and t.status != TransferStatus::Attesting
          and t.status != TransferStatus::Disputed) {
        continue;
      }
      refreshAttestations(t);
      if (not contains(t.attestations, event.validator)) {
        continue;
      }
      DisputeCause cause{.slash = event.id, .validator = event.validator};
      if (t.status == TransferStatus::Disputed) {
        if (std::ranges::none_of(t.disputes, caused)) {
          t.disputes.push_back(std::move(cause));
        }
        continue;
      }
      auto previous = t.status;
      if (not transit(t,
                      TransferStatus::Disputed,
                      fmt::format("slash #{} of {} for {}",
                                  event.id,
                                  event.validator,
                                  event.reason))) {
        continue;
      }
      t.status_before_dispute = previous;
      t.disputes = {std::move(cause)};
      t.dispute_deadline = now + config_.dispute_timeout;
      opened.emplace_back(t.id, t.amount);
    }

    for (const auto &[id, amount] : opened) {
      raise(alert::AlertType::DisputeOpened,
            id,
            amount,
            fmt::format("counted attestation of {} implicated by slash #{}",
                        event.validator,
                        event.id));
    }
  }

  TransferStateMachineImpl::Resumption TransferStateMachineImpl::resumeLocked(
      Entry &entry, DisputeResolution resolution, clock::TimePoint now) {
    auto &t = entry.transfer;
    if (resolution == DisputeResolution::Revoke) {
      for (const auto &cause : t.disputes) {
        aggregator_->revoke(t.id, cause.validator);
      }
    }
    t.disputes.clear();
    t.dispute_deadline.reset();
    auto previous = t.status_before_dispute.value_or(TransferStatus::Attesting);
    t.status_before_dispute.reset();
    transit(t,
            previous,
            resolution == DisputeResolution::Release
                ? "dispute released"
                : "disputed attestations revoked");
    refreshAttestations(t);

    Resumption resumption;
    resumption.finalization = finalizeLocked(entry);
    if (not resumption.finalization) {
      resumption.expiry = expireLocked(entry, now);
    }
    return resumption;
  }

  void TransferStateMachineImpl::completeResumption(
      const Resumption &resumption) {
    if (resumption.finalization) {
      completeFinalization(*resumption.finalization);
    }
    if (resumption.expiry) {
      completeExpiry(*resumption.expiry);
    }
  }

  outcome::result<void> TransferStateMachineImpl::resolveDispute(
      const TransferId &transfer_id, DisputeResolution resolution) {
    auto e = entry(transfer_id);
    if (not e) {
      return TransferError::UNKNOWN_TRANSFER;
    }
    Resumption resumption;
    {
      std::lock_guard guard{e->mutex};
      if (e->transfer.status != TransferStatus::Disputed) {
        return TransferError::NOT_DISPUTED;
      }
      resumption = resumeLocked(*e, resolution, clock_->now());
    }
    completeResumption(resumption);
    return outcome::success();
  }

  outcome::result<TxHash> TransferStateMachineImpl::retrySubmission(
      const TransferId &transfer_id) {
    auto e = entry(transfer_id);
    if (not e) {
      return TransferError::UNKNOWN_TRANSFER;
    }
    std::lock_guard guard{e->mutex};
    auto &t = e->transfer;
    if (t.status != TransferStatus::Finalized or not t.requires_operator) {
      return TransferError::NOT_AWAITING_OPERATOR;
    }
    auto proof = aggregator_->proof(t.id);
    if (not proof) {
      return TransferError::NOT_AWAITING_OPERATOR;
    }
    SL_INFO(logger_, "Operator retries mint of transfer {}", t.id);
    return submitMint(t, std::move(proof.value()));
  }

  size_t TransferStateMachineImpl::pruneSettled() {
    auto horizon = clock_->now() - config_.settled_retention;
    std::vector<TransferId> stale;
    for (const auto &e : entries()) {
      std::lock_guard guard{e->mutex};
      const auto &t = e->transfer;
      if (primitives::isTerminal(t.status) and not t.history.empty()
          and t.history.back().at <= horizon) {
        stale.push_back(t.id);
      }
    }
    if (stale.empty()) {
      return 0;
    }
    // settled transfers never change again, the replay guard refuses them
    transfers_.exclusiveAccess([&](auto &transfers) {
      for (const auto &id : stale) {
        transfers.erase(id);
      }
    });
    for (const auto &id : stale) {
      aggregator_->remove(id);
    }
    SL_DEBUG(logger_, "{} settled transfers forgotten", stale.size());
    return stale.size();
  }

  void TransferStateMachineImpl::setPaused(bool paused) {
    if (paused_.exchange(paused) == paused) {
      return;
    }
    SL_INFO(logger_, "Bridge {}", paused ? "paused" : "unpaused");
    if (paused) {
      return;
    }
    for (const auto &e : entries()) {
      std::optional<Finalization> finalization;
      {
        std::lock_guard guard{e->mutex};
        if (not e->transfer.held) {
          continue;
        }
        e->transfer.held = false;
        finalization = finalizeLocked(*e);
      }
      if (finalization) {
        completeFinalization(*finalization);
      }
    }
  }

  std::optional<Transfer> TransferStateMachineImpl::get(
      const TransferId &transfer_id) const {
    auto e = entry(transfer_id);
    if (not e) {
      return std::nullopt;
    }
    std::lock_guard guard{e->mutex};
    return e->transfer;
  }

  std::vector<Transfer> TransferStateMachineImpl::list(
      std::optional<TransferStatus> status, size_t offset, size_t limit) const {
    std::vector<Transfer> all;
    for (const auto &e : entries()) {
      std::lock_guard guard{e->mutex};
      if (not status or e->transfer.status == *status) {
        all.push_back(e->transfer);
      }
    }
    std::ranges::sort(all, [](const Transfer &lhs, const Transfer &rhs) {
      if (lhs.created_at != rhs.created_at) {
        return lhs.created_at < rhs.created_at;
      }
      return lhs.id < rhs.id;
    });
    if (offset >= all.size()) {
      return {};
    }
    auto last = offset + std::min(limit, all.size() - offset);
    return {std::make_move_iterator(all.begin() + offset),
            std::make_move_iterator(all.begin() + last)};
  }

  std::vector<Transfer> TransferStateMachineImpl::unsettled() const {
    std::vector<Transfer> res;
    for (const auto &e : entries()) {
      std::lock_guard guard{e->mutex};
      if (not primitives::isTerminal(e->transfer.status)) {
        res.push_back(e->transfer);
      }
    }
    return res;
  }

  std::vector<primitives::TransferEvent> TransferStateMachineImpl::history(
      const TransferId &transfer_id) const {
    auto e = entry(transfer_id);
    if (not e) {
      return {};
    }
    std::lock_guard guard{e->mutex};
    return e->transfer.history;
  }

}  // namespace qbridge::transfer
