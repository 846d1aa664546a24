/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/chain_adapter.hpp"
#include "chain/ledger_client.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(qbridge::chain, ChainSubmissionError, e) {
  using E = qbridge::chain::ChainSubmissionError;
  switch (e) {
    case E::RETRIES_EXHAUSTED:
      return "Ledger stayed unavailable for all submission attempts";
    case E::REJECTED:
      return "Ledger rejected the submission";
    case E::WRONG_CHAIN:
      return "Submission addressed to another chain";
    case E::RETRY_SCHEDULED:
      return "Ledger is unavailable, submission will be retried";
    case E::IN_PROGRESS:
      return "Submission of the transfer is already in progress";
  }
  return "Unknown chain submission error";
}

OUTCOME_CPP_DEFINE_CATEGORY(qbridge::chain, LedgerError, e) {
  using E = qbridge::chain::LedgerError;
  switch (e) {
    case E::UNAVAILABLE:
      return "Ledger is unavailable";
    case E::REJECTED:
      return "Ledger rejected the transaction";
    case E::UNKNOWN_TRANSFER:
      return "Ledger knows nothing about the transfer";
  }
  return "Unknown ledger error";
}
