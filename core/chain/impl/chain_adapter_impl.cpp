/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/impl/chain_adapter_impl.hpp"

#include <algorithm>

#include <boost/assert.hpp>

namespace qbridge::chain {

  using primitives::BlockNumber;
  using primitives::LockEvent;
  using primitives::TransferId;
  using primitives::TxHash;

  ChainAdapterImpl::ChainAdapterImpl(Config config,
                                     std::shared_ptr<LedgerClient> ledger,
                                     std::shared_ptr<ChainConfigStore> configs,
                                     clock::TimerFactory timer_factory)
      : config_{config},
        ledger_{std::move(ledger)},
        configs_{std::move(configs)},
        timer_factory_{std::move(timer_factory)},
        logger_{log::createLogger(
            fmt::format("ChainAdapter#{}", config.chain_id), "chain")},
        next_block_{config.start_block} {
    BOOST_ASSERT(ledger_);
    BOOST_ASSERT(configs_);
  }

  void ChainAdapterImpl::subscribeLocks(std::weak_ptr<ChainObserver> observer) {
    observers_.exclusiveAccess(
        [&](auto &observers) { observers.emplace_back(std::move(observer)); });
  }

  std::vector<std::shared_ptr<ChainObserver>> ChainAdapterImpl::observers()
      const {
    return observers_.sharedAccess([](const auto &observers) {
      std::vector<std::shared_ptr<ChainObserver>> res;
      for (const auto &weak : observers) {
        if (auto observer = weak.lock()) {
          res.emplace_back(std::move(observer));
        }
      }
      return res;
    });
  }

  uint32_t ChainAdapterImpl::requiredConfirmations() const {
    auto config = configs_->get(config_.chain_id);
    return config ? config->confirmations_required : 1;
  }

  outcome::result<TxHash> ChainAdapterImpl::submitMint(
      const primitives::MintOrder &order) {
    if (order.dest_chain != config_.chain_id) {
      return ChainSubmissionError::WRONG_CHAIN;
    }
    return submit(Submission{.kind = SubmissionKind::Mint,
                             .transfer_id = order.transfer_id,
                             .order = order,
                             .backoff = config_.retry.initial_backoff});
  }

  outcome::result<TxHash> ChainAdapterImpl::submitRefund(
      const TransferId &transfer_id) {
    return submit(Submission{.kind = SubmissionKind::Refund,
                             .transfer_id = transfer_id,
                             .backoff = config_.retry.initial_backoff});
  }

  outcome::result<TxHash> ChainAdapterImpl::submit(Submission submission) {
    auto claim = submissions_.exclusiveAccess(
        [&](Submissions &s) -> outcome::result<std::optional<TxHash>> {
          const auto &done = submission.kind == SubmissionKind::Mint
                               ? s.mints
                               : s.refunds;
          if (auto it = done.find(submission.transfer_id); it != done.end()) {
            return std::optional<TxHash>{it->second};
          }
          if (not s.in_flight.insert(submission.key()).second) {
            return ChainSubmissionError::IN_PROGRESS;
          }
          return std::optional<TxHash>{};
        });
    OUTCOME_TRY(existing, claim);
    if (existing.has_value()) {
      SL_DEBUG(logger_,
               "{} of {} already submitted as {}",
               submission.kind == SubmissionKind::Mint ? "Mint" : "Refund",
               submission.transfer_id,
               existing.value());
      return existing.value();
    }
    return attempt(std::move(submission));
  }

  outcome::result<TxHash> ChainAdapterImpl::send(const Submission &submission) {
    const auto &id = submission.transfer_id;
    if (submission.kind == SubmissionKind::Refund) {
      OUTCOME_TRY(existing, ledger_->findRefund(id));
      if (existing.has_value()) {
        return existing.value();
      }
      return ledger_->refund(id);
    }
    OUTCOME_TRY(existing, ledger_->findMint(id));
    if (existing.has_value()) {
      SL_DEBUG(logger_, "Mint of {} found on ledger", id);
      return existing.value();
    }
    return ledger_->mint(submission.order.value());
  }

  outcome::result<TxHash> ChainAdapterImpl::attempt(Submission submission) {
    auto what = submission.kind == SubmissionKind::Mint ? "Mint" : "Refund";
    for (;;) {
      ++submission.attempts;
      auto res = send(submission);
      if (res.has_value()) {
        finish(submission, res.value());
        return res.value();
      }
      if (res.error() != LedgerError::UNAVAILABLE) {
        SL_ERROR(logger_,
                 "{} of {} rejected: {}",
                 what,
                 submission.transfer_id,
                 res.error().message());
        finish(submission, std::nullopt);
        return ChainSubmissionError::REJECTED;
      }
      if (submission.attempts >= config_.retry.max_attempts) {
        SL_ERROR(logger_,
                 "{} of {} failed after {} attempts",
                 what,
                 submission.transfer_id,
                 submission.attempts);
        finish(submission, std::nullopt);
        return ChainSubmissionError::RETRIES_EXHAUSTED;
      }
      SL_WARN(logger_,
              "{} of {} failed (attempt {} of {}), retrying",
              what,
              submission.transfer_id,
              submission.attempts,
              config_.retry.max_attempts);
      if (timer_factory_) {
        scheduleRetry(std::move(submission));
        return ChainSubmissionError::RETRY_SCHEDULED;
      }
    }
  }

  void ChainAdapterImpl::scheduleRetry(Submission submission) {
    auto key = submission.key();
    auto timer = timer_factory_();
    timer->expiresAfter(submission.backoff);
    submission.backoff =
        std::min(submission.backoff * 2, config_.retry.max_backoff);
    timer->asyncWait(
        [weak{weak_from_this()}, submission{std::move(submission)}](
            const boost::system::error_code &ec) mutable {
          if (auto self = weak.lock()) {
            if (ec) {
              self->finish(submission, std::nullopt);
              return;
            }
            self->onRetry(std::move(submission));
          }
        });
    // the replaced timer is the fired one, it goes outside of the lock
    submissions_.exclusiveAccess(
        [&](Submissions &s) { std::swap(s.retry_timers[key], timer); });
  }

  void ChainAdapterImpl::onRetry(Submission submission) {
    auto transfer_id = submission.transfer_id;
    auto res = attempt(std::move(submission));
    if (res.has_value()
        or res.error() == ChainSubmissionError::RETRY_SCHEDULED) {
      return;
    }
    for (const auto &observer : observers()) {
      observer->onSubmissionFailed(transfer_id, res.error());
    }
  }

  void ChainAdapterImpl::finish(const Submission &submission,
                                const std::optional<TxHash> &tx_hash) {
    // destroyed outside of the lock
    std::unique_ptr<clock::Timer> fired;
    submissions_.exclusiveAccess([&](Submissions &s) {
      s.in_flight.erase(submission.key());
      if (auto it = s.retry_timers.find(submission.key());
          it != s.retry_timers.end()) {
        fired = std::move(it->second);
        s.retry_timers.erase(it);
      }
      if (not tx_hash) {
        return;
      }
      auto &done = submission.kind == SubmissionKind::Mint ? s.mints
                                                           : s.refunds;
      done.emplace(submission.transfer_id, *tx_hash);
    });
    if (not tx_hash) {
      return;
    }
    if (submission.kind == SubmissionKind::Mint) {
      pending_mints_.exclusiveAccess([&](auto &pending) {
        pending.emplace(submission.transfer_id, *tx_hash);
      });
      const auto &order = submission.order.value();
      SL_INFO(logger_,
              "Mint of {} for {} to {} submitted as {}",
              order.transfer_id,
              order.amount,
              order.recipient,
              *tx_hash);
    } else {
      SL_INFO(logger_,
              "Refund of {} submitted as {}",
              submission.transfer_id,
              *tx_hash);
    }
  }

  outcome::result<uint32_t> ChainAdapterImpl::confirmations(
      const TxHash &tx_hash) {
    OUTCOME_TRY(block, ledger_->txBlock(tx_hash));
    if (not block.has_value()) {
      return 0;
    }
    OUTCOME_TRY(latest, ledger_->latestBlock());
    if (latest < block.value()) {
      return 0;
    }
    return static_cast<uint32_t>(latest - block.value() + 1);
  }

  outcome::result<bool> ChainAdapterImpl::verifyLock(const LockEvent &lock) {
    OUTCOME_TRY(locks,
                ledger_->lockEvents(lock.block_number, lock.block_number));
    return std::ranges::find(locks, lock) != locks.end();
  }

  void ChainAdapterImpl::poll() {
    std::vector<LockEvent> observed;
    std::vector<LockEvent> confirmed;
    std::vector<LockEvent> dropped;
    std::vector<std::pair<TransferId, TxHash>> minted;

    {
      std::lock_guard lock{poll_mutex_};

      auto latest_res = ledger_->latestBlock();
      if (latest_res.has_error()) {
        if (healthy_.exchange(false)) {
          SL_WARN(logger_,
                  "Ledger is unreachable: {}",
                  latest_res.error().message());
        }
        return;
      }
      auto latest = latest_res.value();

      if (latest >= next_block_) {
        auto locks_res = ledger_->lockEvents(next_block_, latest);
        if (locks_res.has_error()) {
          healthy_ = false;
          SL_WARN(logger_,
                  "Locks of blocks {}..{} not fetched: {}",
                  next_block_,
                  latest,
                  locks_res.error().message());
          return;
        }
        for (auto &lock : locks_res.value()) {
          if (lock.source_chain != config_.chain_id) {
            SL_WARN(logger_,
                    "Lock #{} names chain #{} as its source, skipped",
                    lock.nonce,
                    lock.source_chain);
            continue;
          }
          if (unconfirmed_.emplace(lock.transferId(), lock).second) {
            observed.push_back(lock);
          }
        }
        next_block_ = latest + 1;
      }
      healthy_ = true;

      auto required = requiredConfirmations();
      for (auto it = unconfirmed_.begin(); it != unconfirmed_.end();) {
        const auto &lock = it->second;
        if (latest < lock.block_number
            or latest - lock.block_number + 1 < required) {
          ++it;
          continue;
        }
        auto present = verifyLock(lock);
        if (present.has_error()) {
          ++it;
          continue;
        }
        if (not present.value()) {
          SL_WARN(logger_,
                  "Lock #{} at block {} disappeared, reorganized away",
                  lock.nonce,
                  lock.block_number);
          dropped.push_back(lock);
          it = unconfirmed_.erase(it);
          continue;
        }
        confirmed.push_back(lock);
        it = unconfirmed_.erase(it);
      }

      auto pending =
          pending_mints_.sharedAccess([](const auto &p) { return p; });
      for (const auto &[transfer_id, tx_hash] : pending) {
        auto block = ledger_->txBlock(tx_hash);
        if (block.has_error() or not block.value().has_value()) {
          continue;
        }
        if (latest >= *block.value()
            and latest - *block.value() + 1 >= required) {
          minted.emplace_back(transfer_id, tx_hash);
        }
      }
      pending_mints_.exclusiveAccess([&](auto &p) {
        for (const auto &[transfer_id, _] : minted) {
          p.erase(transfer_id);
        }
      });
    }

    auto observers = this->observers();
    for (const auto &observer : observers) {
      for (const auto &lock : observed) {
        observer->onLockObserved(lock);
      }
      for (const auto &lock : confirmed) {
        observer->onLockConfirmed(lock);
      }
      for (const auto &lock : dropped) {
        observer->onLockDropped(lock);
      }
      for (const auto &[transfer_id, tx_hash] : minted) {
        observer->onMintConfirmed(transfer_id, tx_hash);
      }
    }
  }

  void ChainAdapterImpl::start() {
    if (running_.exchange(true)) {
      return;
    }
    SL_INFO(logger_,
            "Watching chain #{} every {}ms",
            config_.chain_id,
            config_.poll_interval.count());
    poll();
    if (timer_factory_) {
      poll_timer_ = timer_factory_();
      scheduleNextPoll();
    }
  }

  void ChainAdapterImpl::stop() {
    if (not running_.exchange(false)) {
      return;
    }
    if (poll_timer_) {
      poll_timer_->cancel();
    }
    auto retries = submissions_.exclusiveAccess(
        [](Submissions &s) { return std::exchange(s.retry_timers, {}); });
    for (auto &[_, timer] : retries) {
      timer->cancel();
    }
    SL_INFO(logger_, "Stopped watching chain #{}", config_.chain_id);
  }

  void ChainAdapterImpl::scheduleNextPoll() {
    poll_timer_->expiresAfter(config_.poll_interval);
    poll_timer_->asyncWait(
        [weak{weak_from_this()}](const boost::system::error_code &ec) {
          if (ec) {
            return;
          }
          if (auto self = weak.lock()) {
            if (not self->running_) {
              return;
            }
            self->poll();
            self->scheduleNextPoll();
          }
        });
  }

}  // namespace qbridge::chain
