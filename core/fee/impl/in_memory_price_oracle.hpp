/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "fee/price_oracle.hpp"

#include <map>
#include <memory>

#include "log/logger.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::fee {

  enum class InMemoryPriceOracleError {
    UNKNOWN_PAIR = 1,
  };

  /**
   * Oracle fed by the node itself. Every update starts a new round stamped
   * with the current time, so prices nobody refreshes turn stale.
   */
  class InMemoryPriceOracle : public PriceOracle {
   public:
    explicit InMemoryPriceOracle(std::shared_ptr<clock::SystemClock> clock);

    outcome::result<PriceData> getPrice(
        const std::string &pair) const override;

    void setPrice(const std::string &pair, uint64_t price);

    /// Restamps every known price with the current time
    void refresh();

   private:
    std::shared_ptr<clock::SystemClock> clock_;
    log::Logger logger_;
    SafeObject<std::map<std::string, PriceData>> prices_;
  };

}  // namespace qbridge::fee

OUTCOME_HPP_DECLARE_ERROR(qbridge::fee, InMemoryPriceOracleError);
