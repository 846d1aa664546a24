/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/transfer.hpp"

namespace qbridge::primitives {

  std::string_view toString(TransferStatus status) {
    switch (status) {
      case TransferStatus::Initiated:
        return "Initiated";
      case TransferStatus::Confirmed:
        return "Confirmed";
      case TransferStatus::Attesting:
        return "Attesting";
      case TransferStatus::Finalized:
        return "Finalized";
      case TransferStatus::Completed:
        return "Completed";
      case TransferStatus::Expired:
        return "Expired";
      case TransferStatus::Refunded:
        return "Refunded";
      case TransferStatus::Disputed:
        return "Disputed";
    }
    return "Unknown";
  }

}  // namespace qbridge::primitives
