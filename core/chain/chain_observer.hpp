/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

#include "primitives/lock_event.hpp"

namespace qbridge::chain {

  /**
   * Receiver of ledger events seen by a chain adapter
   */
  class ChainObserver {
   public:
    virtual ~ChainObserver() = default;

    /// Lock is seen for the first time, it may still be reorganized away
    virtual void onLockObserved(const primitives::LockEvent &lock) = 0;

    /// Lock is buried under the required number of confirmations
    virtual void onLockConfirmed(const primitives::LockEvent &lock) = 0;

    /// Observed lock is gone from the ledger before it was confirmed
    virtual void onLockDropped(const primitives::LockEvent &lock) = 0;

    virtual void onMintConfirmed(const primitives::TransferId &transfer_id,
                                 const primitives::TxHash &tx_hash) = 0;

    /// Submission retried in the background has failed for good
    virtual void onSubmissionFailed(const primitives::TransferId &transfer_id,
                                    std::error_code error) = 0;
  };

}  // namespace qbridge::chain
