/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "attestation/attestation_aggregator.hpp"
#include "chain/chain_observer.hpp"
#include "primitives/slash_event.hpp"
#include "primitives/transfer.hpp"

namespace qbridge::transfer {

  enum class DisputeResolution : uint8_t {
    /// Accusation dismissed, the attestations stay counted
    Release,
    /// Attestations of the implicated validators are uncounted
    Revoke,
  };

  /**
   * Owns the lifecycle of every transfer:
   * Initiated -> Confirmed -> Attesting -> Finalized -> Completed, or
   * Expired -> Refunded when no threshold is met in time. A pending transfer
   * whose counted attestation is implicated by a slash is Disputed until
   * resolved.
   */
  class TransferStateMachine : public chain::ChainObserver {
   public:
    /// Forwards the attestation to the aggregator, finalizes on threshold
    virtual outcome::result<attestation::AttestationOutcome> submitAttestation(
        const primitives::Attestation &attestation) = 0;

    /**
     * Expires pending transfers past their deadline
     * @return ids of the transfers expired by this call
     */
    virtual std::vector<primitives::TransferId> expireOverdue() = 0;

    /**
     * Raises an alert for every dispute not resolved in time
     * @return number of such disputes
     */
    virtual size_t reportUnresolvedDisputes() = 0;

    /// Returns the locked value of an expired transfer after the grace period
    virtual outcome::result<primitives::TxHash> refund(
        const primitives::TransferId &transfer_id) = 0;

    virtual void onSlash(const primitives::SlashEvent &event) = 0;

    virtual outcome::result<void> resolveDispute(
        const primitives::TransferId &transfer_id,
        DisputeResolution resolution) = 0;

    /// Resubmits the mint of a finalized transfer left to an operator
    virtual outcome::result<primitives::TxHash> retrySubmission(
        const primitives::TransferId &transfer_id) = 0;

    /**
     * Forgets transfers settled longer than the retention period ago, the
     * replay guard keeps refusing their locks
     * @return number of transfers forgotten
     */
    virtual size_t pruneSettled() = 0;

    /// Holds transfers which reach the threshold until unpaused
    virtual void setPaused(bool paused) = 0;

    virtual bool isPaused() const = 0;

    virtual std::optional<primitives::Transfer> get(
        const primitives::TransferId &transfer_id) const = 0;

    /// Transfers ordered by creation time
    virtual std::vector<primitives::Transfer> list(
        std::optional<primitives::TransferStatus> status,
        size_t offset,
        size_t limit) const = 0;

    /// Transfers neither completed nor refunded, in no particular order
    virtual std::vector<primitives::Transfer> unsettled() const = 0;

    virtual std::vector<primitives::TransferEvent> history(
        const primitives::TransferId &transfer_id) const = 0;
  };

}  // namespace qbridge::transfer
