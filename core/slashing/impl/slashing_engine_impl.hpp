/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "slashing/slashing_engine.hpp"

#include <map>
#include <set>
#include <tuple>
#include <unordered_map>

#include "alert/alert_sink.hpp"
#include "crypto/ed25519_provider.hpp"
#include "log/logger.hpp"
#include "registry/scoring_strategy.hpp"
#include "registry/validator_registry.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::slashing {

  class SlashingEngineImpl : public SlashingEngine {
   public:
    struct Config {
      clock::SystemClock::Duration dispute_window = std::chrono::hours(48);
      size_t missed_window_limit = 5;
    };

    /// Tells whether a lock event really happened on its source ledger
    using LockVerifier =
        std::function<outcome::result<bool>(const primitives::LockEvent &)>;

    SlashingEngineImpl(Config config,
                       std::shared_ptr<registry::ValidatorRegistry> registry,
                       std::shared_ptr<registry::ScoringStrategy> scoring,
                       std::shared_ptr<crypto::Ed25519Provider> crypto,
                       std::shared_ptr<clock::SystemClock> clock,
                       std::shared_ptr<alert::AlertSink> alert_sink,
                       LockVerifier lock_verifier);

    outcome::result<primitives::SlashEvent> reportEquivocation(
        const primitives::Attestation &first,
        const primitives::Attestation &second) override;

    outcome::result<primitives::SlashEvent> reportNonParticipation(
        const primitives::ValidatorId &validator,
        std::vector<primitives::TransferId> missed) override;

    outcome::result<primitives::SlashEvent> reportInvalidAttestation(
        const primitives::Attestation &attestation) override;

    void recordParticipation(
        const primitives::TransferId &transfer_id,
        const std::vector<primitives::ValidatorId> &eligible,
        const std::vector<primitives::ValidatorId> &attested,
        bool expired) override;

    outcome::result<primitives::SlashEvent> submitCounterEvidence(
        primitives::SlashId slash_id,
        const CounterEvidence &evidence) override;

    outcome::result<primitives::SlashEvent> overturn(
        primitives::SlashId slash_id) override;

    std::vector<primitives::SlashEvent> finalizeMatured() override;

    std::optional<primitives::SlashEvent> get(
        primitives::SlashId slash_id) const override;

    std::vector<primitives::SlashEvent> events() const override;

    void subscribe(SlashHandler handler) override;

    /// Consecutive missed windows of the validator
    size_t missedWindows(const primitives::ValidatorId &validator) const;

   private:
    struct Record {
      primitives::SlashEvent event;
      /// Transfers counted as missed by a non-participation accusation
      std::vector<primitives::TransferId> missed;
      /// Attestation accused of describing a lock that never happened
      std::optional<primitives::Attestation> accused;
    };

    struct Misses {
      size_t consecutive = 0;
      std::vector<primitives::TransferId> transfers;
    };

    using ReportKey = std::tuple<primitives::SlashReason,
                                 primitives::ValidatorId,
                                 primitives::TransferId>;

    struct State {
      primitives::SlashId next_id = 1;
      std::map<primitives::SlashId, Record> records;
      std::set<ReportKey> reported;
      std::unordered_map<primitives::ValidatorId, Misses> misses;
    };

    bool verify(const primitives::Attestation &attestation) const;

    /// Creates the event, duplicates of a keyed report are refused
    outcome::result<primitives::SlashEvent> createPending(
        Record record, std::optional<ReportKey> key);

    /// Takes the stake and lowers reputation
    primitives::SlashEvent apply(primitives::SlashEvent event);

    outcome::result<primitives::SlashEvent> markOverturned(
        primitives::SlashId slash_id, bool require_open_window);

    void notify(const primitives::SlashEvent &event) const;

    Config config_;
    std::shared_ptr<registry::ValidatorRegistry> registry_;
    std::shared_ptr<registry::ScoringStrategy> scoring_;
    std::shared_ptr<crypto::Ed25519Provider> crypto_;
    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<alert::AlertSink> alert_sink_;
    LockVerifier lock_verifier_;
    log::Logger logger_;

    SafeObject<State> state_;
    SafeObject<std::vector<SlashHandler>> handlers_;
  };

}  // namespace qbridge::slashing
