/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/transfer_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(qbridge::transfer, TransferError, e) {
  using E = qbridge::transfer::TransferError;
  switch (e) {
    case E::UNKNOWN_TRANSFER:
      return "Transfer is not known";
    case E::REFUND_NOT_AVAILABLE:
      return "Transfer is not expired or its grace period has not elapsed";
    case E::NOT_DISPUTED:
      return "Transfer is not disputed";
    case E::NOT_AWAITING_OPERATOR:
      return "Transfer does not wait for an operator";
    case E::NO_ADAPTER:
      return "No adapter for the chain of the transfer";
    case E::REPLAY:
      return "Transition has already happened";
  }
  return "Unknown transfer error";
}
