/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/registry_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(qbridge::registry, RegistryError, e) {
  using E = qbridge::registry::RegistryError;
  switch (e) {
    case E::INSUFFICIENT_STAKE:
      return "Stake is below the required minimum";
    case E::ALREADY_REGISTERED:
      return "Validator is already registered";
    case E::UNKNOWN_VALIDATOR:
      return "Validator is not registered";
    case E::EXIT_ALREADY_REQUESTED:
      return "Validator has already requested exit";
    case E::EXIT_NOT_REQUESTED:
      return "Validator has not requested exit";
    case E::COOLDOWN_NOT_ELAPSED:
      return "Exit cooldown has not elapsed yet";
    case E::VALIDATOR_SET_TOO_SMALL:
      return "Eligible validator set would drop below the allowed minimum";
  }
  return "Unknown error in validator registry";
}
