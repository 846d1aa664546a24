/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "clock/clock.hpp"
#include "outcome/outcome.hpp"

namespace qbridge::fee {

  /// Fixed point prices carry this many decimals
  constexpr uint32_t kPriceDecimals = 8;

  struct PriceData {
    /// Fiat price of one whole token
    uint64_t price = 0;
    clock::TimePoint updated_at;
    uint64_t round = 0;
  };

  class PriceOracle {
   public:
    virtual ~PriceOracle() = default;

    virtual outcome::result<PriceData> getPrice(
        const std::string &pair) const = 0;
  };

}  // namespace qbridge::fee
