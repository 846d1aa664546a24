/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fee/impl/in_memory_price_oracle.hpp"

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(qbridge::fee, InMemoryPriceOracleError, e) {
  using E = qbridge::fee::InMemoryPriceOracleError;
  switch (e) {
    case E::UNKNOWN_PAIR:
      return "No price is known for the pair";
  }
  return "Unknown error in price oracle";
}

namespace qbridge::fee {

  InMemoryPriceOracle::InMemoryPriceOracle(
      std::shared_ptr<clock::SystemClock> clock)
      : clock_{std::move(clock)},
        logger_{log::createLogger("PriceOracle", "fee")} {
    BOOST_ASSERT(clock_);
  }

  outcome::result<PriceData> InMemoryPriceOracle::getPrice(
      const std::string &pair) const {
    return prices_.sharedAccess(
        [&](const auto &prices) -> outcome::result<PriceData> {
          auto it = prices.find(pair);
          if (it == prices.end()) {
            return InMemoryPriceOracleError::UNKNOWN_PAIR;
          }
          return it->second;
        });
  }

  void InMemoryPriceOracle::setPrice(const std::string &pair, uint64_t price) {
    auto now = clock_->now();
    auto round = prices_.exclusiveAccess([&](auto &prices) {
      auto &data = prices[pair];
      data.price = price;
      data.updated_at = now;
      return ++data.round;
    });
    SL_DEBUG(logger_, "Price of {} is {} in round {}", pair, price, round);
  }

  void InMemoryPriceOracle::refresh() {
    auto now = clock_->now();
    prices_.exclusiveAccess([&](auto &prices) {
      for (auto &[_, data] : prices) {
        data.updated_at = now;
        ++data.round;
      }
    });
  }

}  // namespace qbridge::fee
