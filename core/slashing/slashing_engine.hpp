/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>
#include <variant>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/attestation.hpp"
#include "primitives/slash_event.hpp"

namespace qbridge::slashing {

  /**
   * Proof that an accusation is wrong: an attestation the accused actually
   * signed for a transfer counted as missed, or the lock an accused
   * attestation describes
   */
  using CounterEvidence =
      std::variant<primitives::Attestation, primitives::LockEvent>;

  /**
   * Detects validator misbehaviour and applies stake penalties. Provable
   * equivocation is punished at once, other accusations wait for a dispute
   * window.
   */
  class SlashingEngine {
   public:
    using SlashHandler = std::function<void(const primitives::SlashEvent &)>;

    virtual ~SlashingEngine() = default;

    /// Two differing payloads signed by one validator for one transfer
    virtual outcome::result<primitives::SlashEvent> reportEquivocation(
        const primitives::Attestation &first,
        const primitives::Attestation &second) = 0;

    virtual outcome::result<primitives::SlashEvent> reportNonParticipation(
        const primitives::ValidatorId &validator,
        std::vector<primitives::TransferId> missed) = 0;

    /// Signed attestation which does not match the confirmed lock
    virtual outcome::result<primitives::SlashEvent> reportInvalidAttestation(
        const primitives::Attestation &attestation) = 0;

    /**
     * Tracks attestation windows. Attesting validators have their miss
     * counters reset. If the transfer expired, every eligible validator which
     * did not attest counts a miss.
     */
    virtual void recordParticipation(
        const primitives::TransferId &transfer_id,
        const std::vector<primitives::ValidatorId> &eligible,
        const std::vector<primitives::ValidatorId> &attested,
        bool expired) = 0;

    virtual outcome::result<primitives::SlashEvent> submitCounterEvidence(
        primitives::SlashId slash_id, const CounterEvidence &evidence) = 0;

    /// Decision of an external adjudicator
    virtual outcome::result<primitives::SlashEvent> overturn(
        primitives::SlashId slash_id) = 0;

    /// Applies pending slashes whose dispute window has closed
    virtual std::vector<primitives::SlashEvent> finalizeMatured() = 0;

    virtual std::optional<primitives::SlashEvent> get(
        primitives::SlashId slash_id) const = 0;

    virtual std::vector<primitives::SlashEvent> events() const = 0;

    /// Handler receives every new event and every status change
    virtual void subscribe(SlashHandler handler) = 0;
  };

}  // namespace qbridge::slashing
