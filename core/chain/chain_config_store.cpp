/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/chain_config_store.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(qbridge::chain, ChainConfigError, e) {
  using E = qbridge::chain::ChainConfigError;
  switch (e) {
    case E::UNKNOWN_CHAIN:
      return "Chain is not configured";
    case E::INVALID_AMOUNT_LIMITS:
      return "Minimal amount exceeds maximal amount";
    case E::INVALID_FEE:
      return "Fee basis points exceed 100%";
    case E::INVALID_THRESHOLD:
      return "Attestation threshold and confirmations must be positive";
    case E::INVALID_FIAT_BOUNDS:
      return "Fiat fee bounds need a price pair, ordered bounds and at most "
             "38 token decimals";
  }
  return "Unknown error in chain config store";
}

namespace qbridge::chain {

  using primitives::ChainConfig;

  ChainConfigStore::ChainConfigStore()
      : logger_{log::createLogger("ChainConfigStore", "chain")} {}

  outcome::result<void> ChainConfigStore::validate(const ChainConfig &config) {
    if (config.min_amount > config.max_amount) {
      return ChainConfigError::INVALID_AMOUNT_LIMITS;
    }
    if (config.fee_basis_points > primitives::kBasisPointsDenominator) {
      return ChainConfigError::INVALID_FEE;
    }
    if (config.attestation_threshold == 0
        or config.confirmations_required == 0) {
      return ChainConfigError::INVALID_THRESHOLD;
    }
    if (config.fiat) {
      const auto &fiat = *config.fiat;
      if (fiat.price_pair.empty()
          or fiat.token_decimals > primitives::kMaxTokenDecimals
          or (fiat.max_fee > 0 and fiat.min_fee > fiat.max_fee)) {
        return ChainConfigError::INVALID_FIAT_BOUNDS;
      }
    }
    return outcome::success();
  }

  outcome::result<std::shared_ptr<const ChainConfig>> ChainConfigStore::publish(
      ChainConfig config) {
    OUTCOME_TRY(validate(config));
    return configs_.exclusiveAccess(
        [&](auto &configs) -> std::shared_ptr<const ChainConfig> {
          auto &slot = configs[config.chain_id];
          config.version = slot ? slot->version + 1 : 1;
          slot = std::make_shared<const ChainConfig>(std::move(config));
          SL_INFO(logger_,
                  "Chain #{} config v{} published (threshold {}, "
                  "confirmations {})",
                  slot->chain_id,
                  slot->version,
                  slot->attestation_threshold,
                  slot->confirmations_required);
          return slot;
        });
  }

  outcome::result<std::shared_ptr<const ChainConfig>>
  ChainConfigStore::updateThresholds(
      primitives::ChainId chain_id,
      std::optional<uint32_t> attestation_threshold,
      std::optional<uint32_t> confirmations_required) {
    auto current = get(chain_id);
    if (not current) {
      return ChainConfigError::UNKNOWN_CHAIN;
    }
    auto next = *current;
    if (attestation_threshold) {
      next.attestation_threshold = *attestation_threshold;
    }
    if (confirmations_required) {
      next.confirmations_required = *confirmations_required;
    }
    return publish(std::move(next));
  }

  std::shared_ptr<const ChainConfig> ChainConfigStore::get(
      primitives::ChainId chain_id) const {
    return configs_.sharedAccess(
        [&](const auto &configs) -> std::shared_ptr<const ChainConfig> {
          auto it = configs.find(chain_id);
          return it == configs.end() ? nullptr : it->second;
        });
  }

  std::vector<std::shared_ptr<const ChainConfig>> ChainConfigStore::all()
      const {
    return configs_.sharedAccess([](const auto &configs) {
      std::vector<std::shared_ptr<const ChainConfig>> res;
      res.reserve(configs.size());
      for (const auto &[_, config] : configs) {
        res.push_back(config);
      }
      return res;
    });
  }

}  // namespace qbridge::chain
