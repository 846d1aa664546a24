/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include "chain/chain_observer.hpp"
#include "crypto/ed25519_provider.hpp"
#include "log/logger.hpp"
#include "transfer/transfer_state_machine.hpp"

namespace qbridge::application {

  /**
   * Validators run inside the node in developers mode. Each of them attests
   * every confirmed lock with its own key.
   */
  class DevValidators : public chain::ChainObserver {
   public:
    DevValidators(size_t count,
                  std::shared_ptr<crypto::Ed25519Provider> crypto,
                  std::shared_ptr<clock::SystemClock> clock,
                  std::weak_ptr<transfer::TransferStateMachine> transfers);

    const std::vector<crypto::Ed25519Keypair> &keypairs() const {
      return keypairs_;
    }

    void onLockObserved(const primitives::LockEvent &) override {}

    void onLockConfirmed(const primitives::LockEvent &lock) override;

    void onLockDropped(const primitives::LockEvent &) override {}

    void onMintConfirmed(const primitives::TransferId &,
                         const primitives::TxHash &) override {}

    void onSubmissionFailed(const primitives::TransferId &,
                            std::error_code) override {}

   private:
    std::shared_ptr<crypto::Ed25519Provider> crypto_;
    std::shared_ptr<clock::SystemClock> clock_;
    std::weak_ptr<transfer::TransferStateMachine> transfers_;
    std::vector<crypto::Ed25519Keypair> keypairs_;
    log::Logger logger_;
  };

}  // namespace qbridge::application
