/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/impl/in_memory_ledger.hpp"

#include <algorithm>

#include "crypto/sha/sha256.hpp"

namespace qbridge::chain {

  using primitives::Balance;
  using primitives::BlockNumber;
  using primitives::LockEvent;
  using primitives::TransferId;
  using primitives::TxHash;

  InMemoryLedger::InMemoryLedger(primitives::ChainId chain_id)
      : chain_id_{chain_id},
        logger_{log::createLogger(fmt::format("Ledger#{}", chain_id),
                                  "chain")} {}

  outcome::result<void> InMemoryLedger::available() {
    if (unavailable_) {
      return LedgerError::UNAVAILABLE;
    }
    return outcome::success();
  }

  TxHash InMemoryLedger::txHash(std::string_view kind,
                                const TransferId &transfer_id) const {
    auto preimage =
        fmt::format("{}:{}:{}", kind, chain_id_, transfer_id.toHex());
    return TxHash{crypto::sha256(preimage)};
  }

  outcome::result<BlockNumber> InMemoryLedger::latestBlock() {
    std::lock_guard lock{mutex_};
    OUTCOME_TRY(available());
    return block_;
  }

  outcome::result<std::vector<LockEvent>> InMemoryLedger::lockEvents(
      BlockNumber from, BlockNumber to) {
    std::lock_guard lock{mutex_};
    OUTCOME_TRY(available());
    std::vector<LockEvent> res;
    for (const auto &event : locks_) {
      if (event.block_number >= from and event.block_number <= to) {
        res.push_back(event);
      }
    }
    return res;
  }

  outcome::result<TxHash> InMemoryLedger::mint(
      const primitives::MintOrder &order) {
    std::lock_guard lock{mutex_};
    OUTCOME_TRY(available());
    if (failing_submissions_ > 0) {
      --failing_submissions_;
      return LedgerError::UNAVAILABLE;
    }
    if (order.proof.attestations.empty()
        or mints_.contains(order.transfer_id)) {
      return LedgerError::REJECTED;
    }
    auto hash = txHash("mint", order.transfer_id);
    ++block_;
    mints_.emplace(order.transfer_id, hash);
    txs_.emplace(hash, block_);
    balances_[order.recipient] += order.amount;
    ++mint_count_;
    SL_DEBUG(logger_,
             "Minted {} to {} at block {}",
             order.amount,
             order.recipient,
             block_);
    return hash;
  }

  outcome::result<TxHash> InMemoryLedger::refund(
      const TransferId &transfer_id) {
    std::lock_guard lock{mutex_};
    OUTCOME_TRY(available());
    if (failing_submissions_ > 0) {
      --failing_submissions_;
      return LedgerError::UNAVAILABLE;
    }
    auto it = std::ranges::find_if(locks_, [&](const LockEvent &event) {
      return event.transferId() == transfer_id;
    });
    if (it == locks_.end()) {
      return LedgerError::UNKNOWN_TRANSFER;
    }
    if (refunds_.contains(transfer_id)) {
      return LedgerError::REJECTED;
    }
    auto hash = txHash("refund", transfer_id);
    ++block_;
    refunds_.emplace(transfer_id, hash);
    txs_.emplace(hash, block_);
    balances_[it->sender] += it->amount;
    return hash;
  }

  outcome::result<std::optional<TxHash>> InMemoryLedger::findMint(
      const TransferId &transfer_id) {
    std::lock_guard lock{mutex_};
    OUTCOME_TRY(available());
    if (auto it = mints_.find(transfer_id); it != mints_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  outcome::result<std::optional<TxHash>> InMemoryLedger::findRefund(
      const TransferId &transfer_id) {
    std::lock_guard lock{mutex_};
    OUTCOME_TRY(available());
    if (auto it = refunds_.find(transfer_id); it != refunds_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  outcome::result<std::optional<BlockNumber>> InMemoryLedger::txBlock(
      const TxHash &tx_hash) {
    std::lock_guard lock{mutex_};
    OUTCOME_TRY(available());
    if (auto it = txs_.find(tx_hash); it != txs_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  LockEvent InMemoryLedger::lock(primitives::ChainId dest_chain,
                                 const primitives::Address &sender,
                                 const primitives::Address &recipient,
                                 Balance amount) {
    std::lock_guard lock{mutex_};
    ++block_;
    LockEvent event{.source_chain = chain_id_,
                    .dest_chain = dest_chain,
                    .nonce = next_nonce_++,
                    .sender = sender,
                    .recipient = recipient,
                    .amount = amount,
                    .block_number = block_};
    event.tx_hash = txHash("lock", event.transferId());
    txs_.emplace(event.tx_hash, block_);
    locks_.push_back(event);
    return event;
  }

  void InMemoryLedger::produceBlocks(size_t count) {
    std::lock_guard lock{mutex_};
    block_ += count;
  }

  void InMemoryLedger::dropLock(primitives::Nonce nonce) {
    std::lock_guard lock{mutex_};
    std::erase_if(locks_,
                  [&](const LockEvent &event) { return event.nonce == nonce; });
  }

  void InMemoryLedger::setUnavailable(bool unavailable) {
    std::lock_guard lock{mutex_};
    unavailable_ = unavailable;
  }

  void InMemoryLedger::failNextSubmissions(size_t count) {
    std::lock_guard lock{mutex_};
    failing_submissions_ = count;
  }

  size_t InMemoryLedger::mintCount() const {
    std::lock_guard lock{mutex_};
    return mint_count_;
  }

  Balance InMemoryLedger::balanceOf(const primitives::Address &account) const {
    std::lock_guard lock{mutex_};
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
  }

}  // namespace qbridge::chain
