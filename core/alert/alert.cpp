/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alert/alert.hpp"

namespace qbridge::alert {

  std::string_view toString(AlertType type) {
    switch (type) {
      case AlertType::ChainSubmissionFailure:
        return "ChainSubmissionFailure";
      case AlertType::ConsensusTimeout:
        return "ConsensusTimeout";
      case AlertType::Equivocation:
        return "Equivocation";
      case AlertType::SlashApplied:
        return "SlashApplied";
      case AlertType::ValidatorSetBelowMinimum:
        return "ValidatorSetBelowMinimum";
      case AlertType::OracleStale:
        return "OracleStale";
      case AlertType::DisputeOpened:
        return "DisputeOpened";
      case AlertType::DisputeUnresolved:
        return "DisputeUnresolved";
      case AlertType::StuckTransfer:
        return "StuckTransfer";
      case AlertType::ChainUnresponsive:
        return "ChainUnresponsive";
    }
    return "Unknown";
  }

}  // namespace qbridge::alert
