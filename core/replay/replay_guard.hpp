/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <unordered_map>

#include "log/logger.hpp"
#include "primitives/transfer.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::replay {

  /**
   * Remembers transfers which were finalized, expired, completed or refunded.
   * Once a transfer is marked, the only transitions admitted are
   * Finalized -> Completed and Expired -> Refunded, each at most once.
   */
  class ReplayGuard {
   public:
    ReplayGuard();

    /**
     * Checks the transition and marks the transfer when it becomes settled
     * @return false if the transition is a replay and has to be dropped
     */
    bool admit(const primitives::TransferId &id,
               primitives::TransferStatus next);

    /// Transfer has already left the attestation phase for good
    bool isSettled(const primitives::TransferId &id) const;

    std::optional<primitives::TransferStatus> mark(
        const primitives::TransferId &id) const;

   private:
    log::Logger logger_;
    SafeObject<
        std::unordered_map<primitives::TransferId, primitives::TransferStatus>>
        marks_;
  };

}  // namespace qbridge::replay
