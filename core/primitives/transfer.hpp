/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "clock/clock.hpp"
#include "primitives/chain_config.hpp"
#include "primitives/lock_event.hpp"
#include "primitives/slash_event.hpp"

namespace qbridge::primitives {

  enum class TransferStatus : uint8_t {
    Initiated,
    Confirmed,
    Attesting,
    Finalized,
    Completed,
    Expired,
    Refunded,
    Disputed,
  };

  std::string_view toString(TransferStatus status);

  /// No further transition except the settlement step is possible
  inline bool isTerminal(TransferStatus status) {
    return status == TransferStatus::Completed
        or status == TransferStatus::Refunded;
  }

  struct TransferEvent {
    TransferStatus status;
    clock::TimePoint at;
    std::string note;
  };

  /// Slash implicating a counted attestation of a disputed transfer
  struct DisputeCause {
    SlashId slash = 0;
    ValidatorId validator;
  };

  struct Transfer {
    TransferId id;
    ChainId source_chain = 0;
    ChainId dest_chain = 0;
    Address sender;
    Address recipient;
    Balance amount = 0;
    Balance fee = 0;
    Nonce nonce = 0;
    TransferStatus status = TransferStatus::Initiated;

    /// Validators whose attestations are counted toward the threshold
    std::vector<ValidatorId> attestations;
    uint32_t threshold = 0;

    clock::TimePoint created_at;
    clock::TimePoint expires_at;
    std::optional<clock::TimePoint> refund_available_at;
    std::optional<clock::TimePoint> completed_at;

    TxHash lock_tx;
    std::optional<TxHash> mint_tx;
    std::optional<TxHash> refund_tx;

    /// Submission exhausted its retries, an operator has to step in
    bool requires_operator = false;

    /// Threshold was reached while the bridge was paused
    bool held = false;

    std::optional<TransferStatus> status_before_dispute;
    /// Dispute is released once every cause is overturned
    std::vector<DisputeCause> disputes;
    std::optional<clock::TimePoint> dispute_deadline;

    std::shared_ptr<const ChainConfig> source_config;
    std::shared_ptr<const ChainConfig> dest_config;

    std::vector<TransferEvent> history;

    Balance mintAmount() const {
      return amount - fee;
    }
  };

}  // namespace qbridge::primitives

template <>
struct fmt::formatter<qbridge::primitives::TransferStatus>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(qbridge::primitives::TransferStatus status,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        qbridge::primitives::toString(status), ctx);
  }
};
