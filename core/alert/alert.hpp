/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include <fmt/format.h>

#include "clock/clock.hpp"
#include "primitives/common.hpp"

namespace qbridge::alert {

  /// Conditions an operator has to be told about
  enum class AlertType : uint8_t {
    ChainSubmissionFailure,
    ConsensusTimeout,
    Equivocation,
    SlashApplied,
    ValidatorSetBelowMinimum,
    OracleStale,
    DisputeOpened,
    DisputeUnresolved,
    StuckTransfer,
    ChainUnresponsive,
  };

  std::string_view toString(AlertType type);

  struct Alert {
    AlertType type;
    std::optional<primitives::TransferId> transfer_id;
    primitives::Balance amount = 0;
    std::string description;
    clock::TimePoint at;
  };

}  // namespace qbridge::alert

template <>
struct fmt::formatter<qbridge::alert::AlertType>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(qbridge::alert::AlertType type, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        qbridge::alert::toString(type), ctx);
  }
};
