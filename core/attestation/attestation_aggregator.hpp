/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/attestation.hpp"

namespace qbridge::attestation {

  enum class AttestationOutcome : uint8_t {
    /// Counted toward the threshold
    Accepted,
    /// Same validator, same payload. Nothing changed
    Duplicate,
    /// Counted, and the threshold has just been met
    ThresholdReached,
    /// Round is closed or the transfer is settled. Nothing changed
    Ignored,
  };

  /**
   * Collects attestations of a transfer until the threshold is met. Each
   * transfer is a separate round with its own lock.
   */
  class AttestationAggregator {
   public:
    virtual ~AttestationAggregator() = default;

    /**
     * Starts a round
     * @param expected payload derived from the confirmed lock
     * @param threshold number of distinct eligible validators required
     * @param deadline attestations arriving later are ignored
     */
    virtual outcome::result<void> open(
        const primitives::AttestationPayload &expected,
        uint32_t threshold,
        clock::TimePoint deadline) = 0;

    virtual outcome::result<AttestationOutcome> submit(
        const primitives::Attestation &attestation) = 0;

    /// Stops acceptance, collected attestations are kept
    virtual void close(const primitives::TransferId &transfer_id) = 0;

    /// Drops the round entirely
    virtual void remove(const primitives::TransferId &transfer_id) = 0;

    /**
     * Uncounts the attestation of the validator. The validator cannot attest
     * in this round again.
     * @return true if an attestation was uncounted
     */
    virtual bool revoke(const primitives::TransferId &transfer_id,
                        const primitives::ValidatorId &validator) = 0;

    /**
     * @return first threshold-many counted attestations ordered by validator
     * id, none while the threshold is not met
     */
    virtual std::optional<primitives::ProofBundle> proof(
        const primitives::TransferId &transfer_id) const = 0;

    /// Counted attestations in arrival order
    virtual std::vector<primitives::Attestation> attestations(
        const primitives::TransferId &transfer_id) const = 0;

    virtual size_t count(const primitives::TransferId &transfer_id) const = 0;
  };

}  // namespace qbridge::attestation

template <>
struct fmt::formatter<qbridge::attestation::AttestationOutcome>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(qbridge::attestation::AttestationOutcome outcome,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    using qbridge::attestation::AttestationOutcome;
    std::string_view name = "Unknown";
    switch (outcome) {
      case AttestationOutcome::Accepted:
        name = "Accepted";
        break;
      case AttestationOutcome::Duplicate:
        name = "Duplicate";
        break;
      case AttestationOutcome::ThresholdReached:
        name = "ThresholdReached";
        break;
      case AttestationOutcome::Ignored:
        name = "Ignored";
        break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
