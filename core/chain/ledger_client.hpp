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

namespace qbridge::chain {

  enum class LedgerError {
    /// Node is unreachable or timed out, the call may be repeated
    UNAVAILABLE = 1,
    /// Ledger refused the transaction
    REJECTED,
    UNKNOWN_TRANSFER,
  };

  /**
   * Access to the bridge contract deployed on one ledger
   */
  class LedgerClient {
   public:
    virtual ~LedgerClient() = default;

    virtual outcome::result<primitives::BlockNumber> latestBlock() = 0;

    /// Locks included into blocks `[from, to]`
    virtual outcome::result<std::vector<primitives::LockEvent>> lockEvents(
        primitives::BlockNumber from, primitives::BlockNumber to) = 0;

    virtual outcome::result<primitives::TxHash> mint(
        const primitives::MintOrder &order) = 0;

    /// Returns the locked value to the sender
    virtual outcome::result<primitives::TxHash> refund(
        const primitives::TransferId &transfer_id) = 0;

    virtual outcome::result<std::optional<primitives::TxHash>> findMint(
        const primitives::TransferId &transfer_id) = 0;

    virtual outcome::result<std::optional<primitives::TxHash>> findRefund(
        const primitives::TransferId &transfer_id) = 0;

    /// Block the transaction is included into, none while it is not mined
    virtual outcome::result<std::optional<primitives::BlockNumber>> txBlock(
        const primitives::TxHash &tx_hash) = 0;
  };

}  // namespace qbridge::chain

OUTCOME_HPP_DECLARE_ERROR(qbridge::chain, LedgerError);
