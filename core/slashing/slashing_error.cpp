/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "slashing/slashing_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(qbridge::slashing, SlashingError, e) {
  using E = qbridge::slashing::SlashingError;
  switch (e) {
    case E::UNKNOWN_SLASH:
      return "Slash event is not known";
    case E::INVALID_SIGNATURE:
      return "Evidence carries an invalid signature";
    case E::NOT_EQUIVOCATION:
      return "Attestations do not prove equivocation";
    case E::ALREADY_REPORTED:
      return "Misbehaviour has already been reported";
    case E::NOT_PENDING:
      return "Slash event is not pending";
    case E::DISPUTE_WINDOW_CLOSED:
      return "Dispute window of the slash event is closed";
    case E::EVIDENCE_REJECTED:
      return "Counter-evidence does not refute the accusation";
  }
  return "Unknown error in slashing engine";
}
