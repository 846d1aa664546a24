/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "attestation/attestation_aggregator.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>

#include "crypto/ed25519_provider.hpp"
#include "log/logger.hpp"
#include "registry/validator_registry.hpp"
#include "replay/replay_guard.hpp"
#include "slashing/slashing_engine.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::attestation {

  class AttestationAggregatorImpl : public AttestationAggregator {
   public:
    AttestationAggregatorImpl(
        std::shared_ptr<registry::ValidatorRegistry> registry,
        std::shared_ptr<slashing::SlashingEngine> slashing,
        std::shared_ptr<replay::ReplayGuard> replay_guard,
        std::shared_ptr<crypto::Ed25519Provider> crypto,
        std::shared_ptr<clock::SystemClock> clock);

    outcome::result<void> open(const primitives::AttestationPayload &expected,
                               uint32_t threshold,
                               clock::TimePoint deadline) override;

    outcome::result<AttestationOutcome> submit(
        const primitives::Attestation &attestation) override;

    void close(const primitives::TransferId &transfer_id) override;

    void remove(const primitives::TransferId &transfer_id) override;

    bool revoke(const primitives::TransferId &transfer_id,
                const primitives::ValidatorId &validator) override;

    std::optional<primitives::ProofBundle> proof(
        const primitives::TransferId &transfer_id) const override;

    std::vector<primitives::Attestation> attestations(
        const primitives::TransferId &transfer_id) const override;

    size_t count(const primitives::TransferId &transfer_id) const override;

   private:
    struct Round {
      mutable std::mutex mutex;
      primitives::AttestationPayload expected;
      uint32_t threshold = 0;
      clock::TimePoint deadline;
      bool closed = false;
      bool threshold_reported = false;
      /// Counted attestations, arrival order
      std::vector<primitives::Attestation> accepted;
      /// First signed attestation of every validator heard in the round
      std::unordered_map<primitives::ValidatorId, primitives::Attestation>
          first_seen;
    };

    std::shared_ptr<Round> round(const primitives::TransferId &id) const;

    bool verify(const primitives::Attestation &attestation) const;

    std::shared_ptr<registry::ValidatorRegistry> registry_;
    std::shared_ptr<slashing::SlashingEngine> slashing_;
    std::shared_ptr<replay::ReplayGuard> replay_guard_;
    std::shared_ptr<crypto::Ed25519Provider> crypto_;
    std::shared_ptr<clock::SystemClock> clock_;
    log::Logger logger_;

    SafeObject<
        std::unordered_map<primitives::TransferId, std::shared_ptr<Round>>>
        rounds_;
  };

}  // namespace qbridge::attestation
