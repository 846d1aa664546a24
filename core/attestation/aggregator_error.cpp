/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/aggregator_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(qbridge::attestation, AggregatorError, e) {
  using E = qbridge::attestation::AggregatorError;
  switch (e) {
    case E::INVALID_SIGNATURE:
      return "Attestation signature is invalid";
    case E::INELIGIBLE_VALIDATOR:
      return "Validator is not eligible to attest";
    case E::PAYLOAD_MISMATCH:
      return "Attested payload does not match the confirmed lock";
    case E::EQUIVOCATION:
      return "Validator has signed a conflicting attestation";
    case E::UNKNOWN_TRANSFER:
      return "No attestation round for the transfer";
    case E::ROUND_ALREADY_OPEN:
      return "Attestation round for the transfer is already open";
  }
  return "Unknown error in attestation aggregator";
}
