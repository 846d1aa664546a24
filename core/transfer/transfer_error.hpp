/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace qbridge::transfer {

  enum class TransferError {
    UNKNOWN_TRANSFER = 1,
    REFUND_NOT_AVAILABLE,
    NOT_DISPUTED,
    NOT_AWAITING_OPERATOR,
    NO_ADAPTER,
    REPLAY,
  };

}  // namespace qbridge::transfer

OUTCOME_HPP_DECLARE_ERROR(qbridge::transfer, TransferError);
