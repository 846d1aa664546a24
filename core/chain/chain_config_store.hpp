/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "primitives/chain_config.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::chain {

  enum class ChainConfigError {
    UNKNOWN_CHAIN = 1,
    INVALID_AMOUNT_LIMITS,
    INVALID_FEE,
    INVALID_THRESHOLD,
    INVALID_FIAT_BOUNDS,
  };

  /**
   * Registry of chain configs. Every change publishes a new immutable
   * snapshot, holders of an older snapshot are not affected.
   */
  class ChainConfigStore {
   public:
    ChainConfigStore();

    /// Publishes a config, version is assigned by the store
    outcome::result<std::shared_ptr<const primitives::ChainConfig>> publish(
        primitives::ChainConfig config);

    outcome::result<std::shared_ptr<const primitives::ChainConfig>>
    updateThresholds(primitives::ChainId chain_id,
                     std::optional<uint32_t> attestation_threshold,
                     std::optional<uint32_t> confirmations_required);

    /// Latest snapshot, nullptr for an unknown chain
    std::shared_ptr<const primitives::ChainConfig> get(
        primitives::ChainId chain_id) const;

    std::vector<std::shared_ptr<const primitives::ChainConfig>> all() const;

   private:
    static outcome::result<void> validate(
        const primitives::ChainConfig &config);

    log::Logger logger_;
    SafeObject<std::map<primitives::ChainId,
                        std::shared_ptr<const primitives::ChainConfig>>>
        configs_;
  };

}  // namespace qbridge::chain

OUTCOME_HPP_DECLARE_ERROR(qbridge::chain, ChainConfigError);
