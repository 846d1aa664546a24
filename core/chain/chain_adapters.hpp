/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <vector>

#include "chain/chain_adapter.hpp"
#include "utils/safe_object.hpp"

namespace qbridge::chain {

  /// Adapters of all bridged ledgers, by chain id
  class ChainAdapters {
   public:
    void add(std::shared_ptr<ChainAdapter> adapter) {
      adapters_.exclusiveAccess([&](auto &adapters) {
        auto id = adapter->chainId();
        adapters[id] = std::move(adapter);
      });
    }

    std::shared_ptr<ChainAdapter> get(primitives::ChainId chain_id) const {
      return adapters_.sharedAccess(
          [&](const auto &adapters) -> std::shared_ptr<ChainAdapter> {
            auto it = adapters.find(chain_id);
            return it == adapters.end() ? nullptr : it->second;
          });
    }

    std::vector<std::shared_ptr<ChainAdapter>> all() const {
      return adapters_.sharedAccess([](const auto &adapters) {
        std::vector<std::shared_ptr<ChainAdapter>> res;
        for (const auto &[_, adapter] : adapters) {
          res.push_back(adapter);
        }
        return res;
      });
    }

   private:
    SafeObject<std::map<primitives::ChainId, std::shared_ptr<ChainAdapter>>>
        adapters_;
  };

}  // namespace qbridge::chain
