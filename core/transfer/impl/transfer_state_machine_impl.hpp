/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "transfer/transfer_state_machine.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "alert/alert_sink.hpp"
#include "chain/chain_adapters.hpp"
#include "chain/chain_config_store.hpp"
#include "clock/timer.hpp"
#include "fee/fee_calculator.hpp"
#include "log/logger.hpp"
#include "registry/validator_registry.hpp"
#include "replay/replay_guard.hpp"
#include "slashing/slashing_engine.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::transfer {

  class TransferStateMachineImpl
      : public TransferStateMachine,
        public std::enable_shared_from_this<TransferStateMachineImpl> {
   public:
    struct Config {
      /// Disputes older than this are reported on every sweep
      clock::SystemClock::Duration dispute_timeout = std::chrono::hours(48);
      /// Completed and refunded transfers are kept this long
      clock::SystemClock::Duration settled_retention = std::chrono::days(7);
    };

    TransferStateMachineImpl(
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
        clock::TimerFactory timer_factory);

    void onLockObserved(const primitives::LockEvent &lock) override;

    void onLockConfirmed(const primitives::LockEvent &lock) override;

    void onLockDropped(const primitives::LockEvent &lock) override;

    void onMintConfirmed(const primitives::TransferId &transfer_id,
                         const primitives::TxHash &tx_hash) override;

    void onSubmissionFailed(const primitives::TransferId &transfer_id,
                            std::error_code error) override;

    outcome::result<attestation::AttestationOutcome> submitAttestation(
        const primitives::Attestation &attestation) override;

    std::vector<primitives::TransferId> expireOverdue() override;

    size_t reportUnresolvedDisputes() override;

    outcome::result<primitives::TxHash> refund(
        const primitives::TransferId &transfer_id) override;

    void onSlash(const primitives::SlashEvent &event) override;

    outcome::result<void> resolveDispute(
        const primitives::TransferId &transfer_id,
        DisputeResolution resolution) override;

    outcome::result<primitives::TxHash> retrySubmission(
        const primitives::TransferId &transfer_id) override;

    size_t pruneSettled() override;

    void setPaused(bool paused) override;

    bool isPaused() const override {
      return paused_.load();
    }

    std::optional<primitives::Transfer> get(
        const primitives::TransferId &transfer_id) const override;

    std::vector<primitives::Transfer> list(
        std::optional<primitives::TransferStatus> status,
        size_t offset,
        size_t limit) const override;

    std::vector<primitives::Transfer> unsettled() const override;

    std::vector<primitives::TransferEvent> history(
        const primitives::TransferId &transfer_id) const override;

   private:
    struct Entry {
      std::mutex mutex;
      primitives::Transfer transfer;
      std::unique_ptr<clock::Timer> deadline_timer;
    };

    /// Work left after a transfer expired, done without its lock
    struct Expiry {
      primitives::TransferId id;
      primitives::Balance amount = 0;
      bool attestation_window_opened = false;
      std::vector<primitives::ValidatorId> attested;
    };

    /// Work left after a transfer finalized, done without its lock
    struct Finalization {
      primitives::TransferId id;
      std::vector<primitives::ValidatorId> attested;
    };

    std::shared_ptr<Entry> entry(const primitives::TransferId &id) const;
    std::vector<std::shared_ptr<Entry>> entries() const;

    /// Transfers whose counted attestations the slash may implicate
    std::vector<std::shared_ptr<Entry>> implicatedBy(
        const primitives::SlashEvent &event) const;

    /**
     * Creates the transfer unless it is known
     * @return its entry, none if the transfer was settled and forgotten
     */
    std::shared_ptr<Entry> create(const primitives::LockEvent &lock);

    /// Reason for the lock to be refused, none if it is acceptable
    std::optional<std::string> checkLock(
        const primitives::LockEvent &lock,
        const std::shared_ptr<const primitives::ChainConfig> &source,
        const std::shared_ptr<const primitives::ChainConfig> &dest) const;

    void armDeadline(Entry &entry);
    void onDeadline(const primitives::TransferId &transfer_id);

    /// Applies a transition through the replay guard, the entry is locked
    bool transit(primitives::Transfer &transfer,
                 primitives::TransferStatus next,
                 std::string note);

    /// Entry is locked
    void refreshAttestations(primitives::Transfer &transfer) const;

    /// Entry is locked
    std::optional<Expiry> expireLocked(Entry &entry, clock::TimePoint now);
    void completeExpiry(const Expiry &expiry);

    /// Entry is locked
    std::optional<Finalization> finalizeLocked(Entry &entry);
    void completeFinalization(const Finalization &finalization);

    struct Resumption {
      std::optional<Finalization> finalization;
      std::optional<Expiry> expiry;
    };

    /// Leaves the Disputed state, the entry is locked
    Resumption resumeLocked(Entry &entry,
                            DisputeResolution resolution,
                            clock::TimePoint now);
    void completeResumption(const Resumption &resumption);

    /// Entry is locked
    outcome::result<primitives::TxHash> submitMint(
        primitives::Transfer &transfer, primitives::ProofBundle proof);

    void raise(alert::AlertType type,
               const primitives::TransferId &transfer_id,
               primitives::Balance amount,
               std::string description);

    Config config_;
    std::shared_ptr<chain::ChainConfigStore> configs_;
    std::shared_ptr<chain::ChainAdapters> adapters_;
    std::shared_ptr<fee::FeeCalculator> fee_calculator_;
    std::shared_ptr<attestation::AttestationAggregator> aggregator_;
    std::shared_ptr<registry::ValidatorRegistry> registry_;
    std::shared_ptr<slashing::SlashingEngine> slashing_;
    std::shared_ptr<replay::ReplayGuard> replay_guard_;
    std::shared_ptr<alert::AlertSink> alert_sink_;
    std::shared_ptr<clock::SystemClock> clock_;
    clock::TimerFactory timer_factory_;
    log::Logger logger_;

    std::atomic_bool paused_ = false;
    SafeObject<
        std::unordered_map<primitives::TransferId, std::shared_ptr<Entry>>>
        transfers_;
  };

}  // namespace qbridge::transfer
