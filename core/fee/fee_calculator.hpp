/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <optional>

#include "alert/alert_sink.hpp"
#include "fee/price_oracle.hpp"
#include "log/logger.hpp"
#include "primitives/chain_config.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::fee {

  enum class FeeError {
    ORACLE_STALE = 1,
    INVALID_PRICE,
    UNSUPPORTED_DECIMALS,
  };

  struct FeeQuote {
    primitives::Balance fee = 0;
    primitives::Balance net_amount = 0;
    /// Price the fiat bounds were converted with
    std::optional<uint64_t> price;
  };

  /**
   * Bridge fee: `base_fee + amount * fee_basis_points / 10000`, never more
   * than the amount. Fiat bounds of the chain are applied while the oracle
   * price is fresh, a transfer itself never waits for the oracle.
   */
  class FeeCalculator {
   public:
    struct Config {
      clock::SystemClock::Duration staleness_cutoff = std::chrono::hours(1);
    };

    FeeCalculator(Config config,
                  std::shared_ptr<PriceOracle> oracle,
                  std::shared_ptr<clock::SystemClock> clock,
                  std::shared_ptr<alert::AlertSink> alert_sink);

    static primitives::Balance computeFee(const primitives::ChainConfig &config,
                                          primitives::Balance amount);

    /**
     * Fee with fiat minimum and cap applied
     * @return ORACLE_STALE while the price is older than the cutoff or its
     * round went backwards
     */
    outcome::result<FeeQuote> quote(const primitives::ChainConfig &config,
                                    primitives::Balance amount);

    /**
     * Fee charged to a new transfer: the quote when it is available, the
     * plain fee while quoting is paused
     */
    primitives::Balance transferFee(const primitives::ChainConfig &config,
                                    primitives::Balance amount);

    bool isQuotingPaused() const;

   private:
    outcome::result<PriceData> freshPrice(const std::string &pair);
    void pause(const std::string &pair, std::string_view why);

    Config config_;
    std::shared_ptr<PriceOracle> oracle_;
    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<alert::AlertSink> alert_sink_;
    log::Logger logger_;

    std::atomic_bool paused_ = false;
    SafeObject<std::map<std::string, uint64_t>> last_rounds_;
  };

}  // namespace qbridge::fee

OUTCOME_HPP_DECLARE_ERROR(qbridge::fee, FeeError);
