/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/slash_event.hpp"

namespace qbridge::primitives {

  std::string_view toString(SlashReason reason) {
    switch (reason) {
      case SlashReason::Equivocation:
        return "Equivocation";
      case SlashReason::NonParticipation:
        return "NonParticipation";
      case SlashReason::InvalidAttestation:
        return "InvalidAttestation";
    }
    return "Unknown";
  }

  std::string_view toString(SlashStatus status) {
    switch (status) {
      case SlashStatus::Pending:
        return "Pending";
      case SlashStatus::Applied:
        return "Applied";
      case SlashStatus::Overturned:
        return "Overturned";
    }
    return "Unknown";
  }

}  // namespace qbridge::primitives
