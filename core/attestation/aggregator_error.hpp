/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace qbridge::attestation {

  /// Attestation is dropped without any change of state
  enum class AggregatorError {
    INVALID_SIGNATURE = 1,
    INELIGIBLE_VALIDATOR,
    PAYLOAD_MISMATCH,
    EQUIVOCATION,
    UNKNOWN_TRANSFER,
    ROUND_ALREADY_OPEN,
  };

}  // namespace qbridge::attestation

OUTCOME_HPP_DECLARE_ERROR(qbridge::attestation, AggregatorError);
