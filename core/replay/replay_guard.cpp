/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "replay/replay_guard.hpp"

namespace qbridge::replay {

  using primitives::TransferStatus;

  namespace {
    bool marking(TransferStatus status) {
      switch (status) {
        case TransferStatus::Finalized:
        case TransferStatus::Completed:
        case TransferStatus::Expired:
        case TransferStatus::Refunded:
          return true;
        default:
          return false;
      }
    }

    bool settles(TransferStatus marked, TransferStatus next) {
      return (marked == TransferStatus::Finalized
              and next == TransferStatus::Completed)
          or (marked == TransferStatus::Expired
              and next == TransferStatus::Refunded);
    }
  }  // namespace

  ReplayGuard::ReplayGuard()
      : logger_{log::createLogger("ReplayGuard", "replay")} {}

  bool ReplayGuard::admit(const primitives::TransferId &id,
                          TransferStatus next) {
    return marks_.exclusiveAccess([&](auto &marks) {
      auto it = marks.find(id);
      if (it == marks.end()) {
        if (marking(next)) {
          marks.emplace(id, next);
        }
        return true;
      }
      if (settles(it->second, next)) {
        it->second = next;
        return true;
      }
      SL_DEBUG(logger_,
               "Transition of transfer {} from {} to {} ignored as a replay",
               id,
               it->second,
               next);
      return false;
    });
  }

  bool ReplayGuard::isSettled(const primitives::TransferId &id) const {
    return marks_.sharedAccess(
        [&](const auto &marks) { return marks.contains(id); });
  }

  std::optional<TransferStatus> ReplayGuard::mark(
      const primitives::TransferId &id) const {
    return marks_.sharedAccess(
        [&](const auto &marks) -> std::optional<TransferStatus> {
          auto it = marks.find(id);
          if (it == marks.end()) {
            return std::nullopt;
          }
          return it->second;
        });
  }

}  // namespace qbridge::replay
