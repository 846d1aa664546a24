/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <fmt/format.h>

#include "clock/clock.hpp"
#include "primitives/common.hpp"

namespace qbridge::primitives {

  enum class SlashReason : uint8_t {
    Equivocation,
    NonParticipation,
    InvalidAttestation,
  };

  enum class SlashStatus : uint8_t { Pending, Applied, Overturned };

  std::string_view toString(SlashReason reason);
  std::string_view toString(SlashStatus status);

  using SlashId = uint64_t;

  struct SlashEvent {
    SlashId id = 0;
    ValidatorId validator;
    SlashReason reason = SlashReason::Equivocation;
    /// Stake taken. Zero while the event is pending
    Balance amount_slashed = 0;
    clock::TimePoint timestamp;
    /// Counter-evidence is accepted until this moment
    clock::TimePoint dispute_deadline;
    SlashStatus status = SlashStatus::Pending;
    std::optional<TransferId> transfer_id;
  };

}  // namespace qbridge::primitives

template <>
struct fmt::formatter<qbridge::primitives::SlashReason>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(qbridge::primitives::SlashReason reason, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        qbridge::primitives::toString(reason), ctx);
  }
};
