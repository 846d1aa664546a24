/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fee/fee_calculator.hpp"

#include <algorithm>
#include <limits>

#include <boost/multiprecision/cpp_int.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(qbridge::fee, FeeError, e) {
  using E = qbridge::fee::FeeError;
  switch (e) {
    case E::ORACLE_STALE:
      return "Oracle price is stale, fee quoting is paused";
    case E::INVALID_PRICE:
      return "Oracle returned zero price";
    case E::UNSUPPORTED_DECIMALS:
      return "Token has too many decimals for fiat fee bounds";
  }
  return "Unknown error in fee calculator";
}

namespace qbridge::fee {

  using boost::multiprecision::uint256_t;
  using primitives::Balance;
  using primitives::ChainConfig;

  namespace {
    /// Converts fiat value into the smallest units of the token
    Balance fiatToTokens(uint64_t fiat, uint64_t price, uint8_t decimals) {
      uint256_t scale = 1;
      for (uint8_t i = 0; i < decimals; ++i) {
        scale *= 10;
      }
      uint256_t tokens = uint256_t{fiat} * scale / price;
      if (tokens > std::numeric_limits<Balance>::max()) {
        return std::numeric_limits<Balance>::max();
      }
      return static_cast<Balance>(tokens);
    }
  }  // namespace

  FeeCalculator::FeeCalculator(Config config,
                               std::shared_ptr<PriceOracle> oracle,
                               std::shared_ptr<clock::SystemClock> clock,
                               std::shared_ptr<alert::AlertSink> alert_sink)
      : config_{config},
        oracle_{std::move(oracle)},
        clock_{std::move(clock)},
        alert_sink_{std::move(alert_sink)},
        logger_{log::createLogger("FeeCalculator", "fee")} {}

  Balance FeeCalculator::computeFee(const ChainConfig &config, Balance amount) {
    using boost::multiprecision::uint128_t;
    uint128_t fee = uint128_t{amount} * config.fee_basis_points
                      / primitives::kBasisPointsDenominator
                  + config.base_fee;
    return static_cast<Balance>(std::min(fee, uint128_t{amount}));
  }

  void FeeCalculator::pause(const std::string &pair, std::string_view why) {
    SL_WARN(logger_, "Price of {} rejected: {}", pair, why);
    if (not paused_.exchange(true)) {
      alert_sink_->raise(alert::Alert{
          .type = alert::AlertType::OracleStale,
          .description = fmt::format("Fee quoting paused, price of {}: {}",
                                     pair,
                                     why),
          .at = clock_->now(),
      });
    }
  }

  outcome::result<PriceData> FeeCalculator::freshPrice(
      const std::string &pair) {
    auto price_res = oracle_->getPrice(pair);
    if (price_res.has_error()) {
      pause(pair, price_res.error().message());
      return FeeError::ORACLE_STALE;
    }
    auto &price = price_res.value();

    if (clock_->now() - price.updated_at > config_.staleness_cutoff) {
      pause(pair, "older than the staleness cutoff");
      return FeeError::ORACLE_STALE;
    }
    auto regressed = last_rounds_.exclusiveAccess([&](auto &rounds) {
      auto [it, inserted] = rounds.emplace(pair, price.round);
      if (not inserted) {
        if (price.round < it->second) {
          return true;
        }
        it->second = price.round;
      }
      return false;
    });
    if (regressed) {
      pause(pair, "round went backwards");
      return FeeError::ORACLE_STALE;
    }
    if (price.price == 0) {
      return FeeError::INVALID_PRICE;
    }

    if (paused_.exchange(false)) {
      SL_INFO(logger_, "Fresh price of {} received, fee quoting resumed", pair);
    }
    return price;
  }

  outcome::result<FeeQuote> FeeCalculator::quote(const ChainConfig &config,
                                                 Balance amount) {
    auto fee = computeFee(config, amount);
    if (not config.fiat.has_value()) {
      return FeeQuote{.fee = fee, .net_amount = amount - fee};
    }
    const auto &fiat = config.fiat.value();
    if (fiat.token_decimals > primitives::kMaxTokenDecimals) {
      return FeeError::UNSUPPORTED_DECIMALS;
    }

    OUTCOME_TRY(price, freshPrice(fiat.price_pair));

    if (fiat.min_fee > 0) {
      fee = std::max(
          fee, fiatToTokens(fiat.min_fee, price.price, fiat.token_decimals));
    }
    if (fiat.max_fee > 0) {
      fee = std::min(
          fee, fiatToTokens(fiat.max_fee, price.price, fiat.token_decimals));
    }
    fee = std::min(fee, amount);
    SL_TRACE(logger_,
             "Quote for {} on chain #{}: fee {} at price {}",
             amount,
             config.chain_id,
             fee,
             price.price);
    return FeeQuote{
        .fee = fee, .net_amount = amount - fee, .price = price.price};
  }

  Balance FeeCalculator::transferFee(const ChainConfig &config,
                                    Balance amount) {
    auto quoted = quote(config, amount);
    if (quoted.has_value()) {
      return quoted.value().fee;
    }
    auto fee = computeFee(config, amount);
    SL_DEBUG(logger_,
             "Fiat bounds of chain #{} skipped ({}), fee {}",
             config.chain_id,
             quoted.error().message(),
             fee);
    return fee;
  }

  bool FeeCalculator::isQuotingPaused() const {
    return paused_.load();
  }

}  // namespace qbridge::fee
