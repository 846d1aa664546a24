/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "fee/price_oracle.hpp"

#include <gmock/gmock.h>

namespace qbridge::fee {

  class PriceOracleMock : public PriceOracle {
   public:
    MOCK_METHOD(outcome::result<PriceData>,
                getPrice,
                (const std::string &),
                (const, override));
  };

}  // namespace qbridge::fee
