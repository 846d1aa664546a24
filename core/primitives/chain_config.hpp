/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>

#include "primitives/common.hpp"

namespace qbridge::primitives {

  enum class ChainRole : uint8_t { Source, Destination, Bidirectional };

  inline bool canSend(ChainRole role) {
    return role != ChainRole::Destination;
  }

  inline bool canReceive(ChainRole role) {
    return role != ChainRole::Source;
  }

  /// Fiat conversions stay within 256 bits up to this many token decimals
  constexpr uint8_t kMaxTokenDecimals = 38;

  /// Fee bounds expressed in fiat. Prices are fixed point with 8 decimals.
  struct FiatFeeBounds {
    std::string price_pair;
    uint8_t token_decimals = 18;
    uint64_t min_fee = 0;
    uint64_t max_fee = 0;
  };

  /**
   * Bridging parameters of one ledger. A config is immutable once published:
   * updates produce a snapshot with an increased version, transfers keep the
   * snapshot they were created with.
   */
  struct ChainConfig {
    ChainId chain_id = 0;
    uint32_t version = 0;
    ChainRole role = ChainRole::Bidirectional;
    Address token_address;
    Balance min_amount = 0;
    Balance max_amount = 0;
    BasisPoints fee_basis_points = 0;
    Balance base_fee = 0;
    uint32_t confirmations_required = 1;
    uint32_t attestation_threshold = 3;
    std::chrono::seconds validation_timeout = std::chrono::hours(24);
    std::chrono::seconds refund_grace_period = std::chrono::hours(1);
    std::optional<FiatFeeBounds> fiat;
  };

}  // namespace qbridge::primitives
