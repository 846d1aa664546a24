/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain/chain_adapter.hpp"

#include <gmock/gmock.h>

namespace qbridge::chain {

  class ChainAdapterMock : public ChainAdapter {
   public:
    MOCK_METHOD(primitives::ChainId, chainId, (), (const, override));

    MOCK_METHOD(void,
                subscribeLocks,
                (std::weak_ptr<ChainObserver>),
                (override));

    MOCK_METHOD(outcome::result<primitives::TxHash>,
                submitMint,
                (const primitives::MintOrder &),
                (override));

    MOCK_METHOD(outcome::result<primitives::TxHash>,
                submitRefund,
                (const primitives::TransferId &),
                (override));

    MOCK_METHOD(outcome::result<uint32_t>,
                confirmations,
                (const primitives::TxHash &),
                (override));

    MOCK_METHOD(outcome::result<bool>,
                verifyLock,
                (const primitives::LockEvent &),
                (override));

    MOCK_METHOD(void, poll, (), (override));

    MOCK_METHOD(void, start, (), (override));

    MOCK_METHOD(void, stop, (), (override));

    MOCK_METHOD(bool, isHealthy, (), (const, override));
  };

}  // namespace qbridge::chain
