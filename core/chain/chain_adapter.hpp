/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "chain/chain_observer.hpp"
#include "outcome/outcome.hpp"
#include "primitives/attestation.hpp"

namespace qbridge::chain {

  enum class ChainSubmissionError {
    RETRIES_EXHAUSTED = 1,
    REJECTED,
    WRONG_CHAIN,
    RETRY_SCHEDULED,
    IN_PROGRESS,
  };

  /**
   * Watches one ledger and submits transactions to it. Submissions are
   * idempotent per transfer. A submission the ledger could not take is
   * retried in the background, its final failure is reported to observers.
   */
  class ChainAdapter {
   public:
    virtual ~ChainAdapter() = default;

    virtual primitives::ChainId chainId() const = 0;

    virtual void subscribeLocks(std::weak_ptr<ChainObserver> observer) = 0;

    /**
     * @return hash of the mint, an earlier one if the transfer was minted,
     * RETRY_SCHEDULED or IN_PROGRESS while it is retried in the background
     */
    virtual outcome::result<primitives::TxHash> submitMint(
        const primitives::MintOrder &order) = 0;

    /// @return hash of the refund, an earlier one if already refunded
    virtual outcome::result<primitives::TxHash> submitRefund(
        const primitives::TransferId &transfer_id) = 0;

    /// Zero for a transaction which is not mined yet
    virtual outcome::result<uint32_t> confirmations(
        const primitives::TxHash &tx_hash) = 0;

    /// Checks that the lock is present on the ledger exactly as described
    virtual outcome::result<bool> verifyLock(
        const primitives::LockEvent &lock) = 0;

    /// One iteration of the watch loop
    virtual void poll() = 0;

    virtual void start() = 0;

    virtual void stop() = 0;

    /// Last poll reached the ledger
    virtual bool isHealthy() const = 0;
  };

}  // namespace qbridge::chain

OUTCOME_HPP_DECLARE_ERROR(qbridge::chain, ChainSubmissionError);
