/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain/ledger_client.hpp"

#include <map>
#include <mutex>
#include <unordered_map>

#include "log/logger.hpp"

namespace qbridge::chain {

  /**
   * Ledger kept in memory. Used by the dev mode and by tests, can simulate
   * outages and reorganizations.
   */
  class InMemoryLedger : public LedgerClient {
   public:
    explicit InMemoryLedger(primitives::ChainId chain_id);

    outcome::result<primitives::BlockNumber> latestBlock() override;

    outcome::result<std::vector<primitives::LockEvent>> lockEvents(
        primitives::BlockNumber from, primitives::BlockNumber to) override;

    outcome::result<primitives::TxHash> mint(
        const primitives::MintOrder &order) override;

    outcome::result<primitives::TxHash> refund(
        const primitives::TransferId &transfer_id) override;

    outcome::result<std::optional<primitives::TxHash>> findMint(
        const primitives::TransferId &transfer_id) override;

    outcome::result<std::optional<primitives::TxHash>> findRefund(
        const primitives::TransferId &transfer_id) override;

    outcome::result<std::optional<primitives::BlockNumber>> txBlock(
        const primitives::TxHash &tx_hash) override;

    /// Locks value in the next block
    primitives::LockEvent lock(primitives::ChainId dest_chain,
                               const primitives::Address &sender,
                               const primitives::Address &recipient,
                               primitives::Balance amount);

    void produceBlocks(size_t count);

    /// Removes the lock as if its block was reorganized away
    void dropLock(primitives::Nonce nonce);

    /// Every call fails with UNAVAILABLE while set
    void setUnavailable(bool unavailable);

    /// The next `count` calls of mint or refund fail with UNAVAILABLE
    void failNextSubmissions(size_t count);

    size_t mintCount() const;

    primitives::Balance balanceOf(const primitives::Address &account) const;

   private:
    outcome::result<void> available();
    primitives::TxHash txHash(std::string_view kind,
                              const primitives::TransferId &transfer_id) const;

    primitives::ChainId chain_id_;
    log::Logger logger_;

    mutable std::mutex mutex_;
    primitives::BlockNumber block_ = 0;
    primitives::Nonce next_nonce_ = 1;
    bool unavailable_ = false;
    size_t failing_submissions_ = 0;
    size_t mint_count_ = 0;

    std::vector<primitives::LockEvent> locks_;
    std::unordered_map<primitives::TransferId, primitives::TxHash> mints_;
    std::unordered_map<primitives::TransferId, primitives::TxHash> refunds_;
    std::unordered_map<primitives::TxHash, primitives::BlockNumber> txs_;
    std::map<primitives::Address, primitives::Balance> balances_;
  };

}  // namespace qbridge::chain
