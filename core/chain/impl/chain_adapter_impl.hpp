/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain/chain_adapter.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>

#include "chain/chain_config_store.hpp"
#include "chain/ledger_client.hpp"
#include "clock/timer.hpp"
#include "log/logger.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::chain {

  /**
   * Bounded exponential backoff of submissions. The first attempt is made by
   * the caller, the next ones on timers. Without timers they follow at once.
   */
  struct RetryPolicy {
    uint32_t max_attempts = 5;
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{30'000};
  };

  class ChainAdapterImpl
      : public ChainAdapter,
        public std::enable_shared_from_this<ChainAdapterImpl> {
   public:
    struct Config {
      primitives::ChainId chain_id = 0;
      /// First block to scan for locks
      primitives::BlockNumber start_block = 0;
      std::chrono::milliseconds poll_interval{5'000};
      RetryPolicy retry;
    };

    ChainAdapterImpl(Config config,
                     std::shared_ptr<LedgerClient> ledger,
                     std::shared_ptr<ChainConfigStore> configs,
                     clock::TimerFactory timer_factory);

    primitives::ChainId chainId() const override {
      return config_.chain_id;
    }

    void subscribeLocks(std::weak_ptr<ChainObserver> observer) override;

    outcome::result<primitives::TxHash> submitMint(
        const primitives::MintOrder &order) override;

    outcome::result<primitives::TxHash> submitRefund(
        const primitives::TransferId &transfer_id) override;

    outcome::result<uint32_t> confirmations(
        const primitives::TxHash &tx_hash) override;

    outcome::result<bool> verifyLock(
        const primitives::LockEvent &lock) override;

    void poll() override;

    void start() override;

    void stop() override;

    bool isHealthy() const override {
      return healthy_.load();
    }

   private:
    enum class SubmissionKind : uint8_t { Mint, Refund };

    using SubmissionKey = std::pair<SubmissionKind, primitives::TransferId>;

    struct Submission {
      SubmissionKind kind = SubmissionKind::Mint;
      primitives::TransferId transfer_id;
      /// Set for mints
      std::optional<primitives::MintOrder> order;
      uint32_t attempts = 0;
      std::chrono::milliseconds backoff{0};

      SubmissionKey key() const {
        return {kind, transfer_id};
      }
    };

    struct Submissions {
      std::unordered_map<primitives::TransferId, primitives::TxHash> mints;
      std::unordered_map<primitives::TransferId, primitives::TxHash> refunds;
      /// Attempted now or waiting for a retry, one per transfer and kind
      std::set<SubmissionKey> in_flight;
      std::map<SubmissionKey, std::unique_ptr<clock::Timer>> retry_timers;
    };

    /// Claims the submission unless it is done or in flight
    outcome::result<primitives::TxHash> submit(Submission submission);

    /// Next attempt of a claimed submission
    outcome::result<primitives::TxHash> attempt(Submission submission);

    /// Asks the ledger first, a timed out attempt may have landed
    outcome::result<primitives::TxHash> send(const Submission &submission);

    void scheduleRetry(Submission submission);
    void onRetry(Submission submission);

    /// Records the transaction of a finished submission, none if it failed
    void finish(const Submission &submission,
                const std::optional<primitives::TxHash> &tx_hash);

    uint32_t requiredConfirmations() const;
    void scheduleNextPoll();

    std::vector<std::shared_ptr<ChainObserver>> observers() const;

    Config config_;
    std::shared_ptr<LedgerClient> ledger_;
    std::shared_ptr<ChainConfigStore> configs_;
    clock::TimerFactory timer_factory_;
    log::Logger logger_;

    std::atomic_bool healthy_ = false;
    std::atomic_bool running_ = false;
    std::unique_ptr<clock::Timer> poll_timer_;

    SafeObject<std::vector<std::weak_ptr<ChainObserver>>> observers_;

    /// Serializes polls
    std::mutex poll_mutex_;
    primitives::BlockNumber next_block_;
    std::map<primitives::TransferId, primitives::LockEvent> unconfirmed_;

    /// Held only around bookkeeping, never while the ledger is called
    SafeObject<Submissions> submissions_;

    /// Mints waiting for confirmations
    SafeObject<std::map<primitives::TransferId, primitives::TxHash>>
        pending_mints_;
  };

}  // namespace qbridge::chain
