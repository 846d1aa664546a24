/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain/chain_observer.hpp"

#include <gmock/gmock.h>

namespace qbridge::chain {

  class ChainObserverMock : public ChainObserver {
   public:
    MOCK_METHOD(void,
                onLockObserved,
                (const primitives::LockEvent &),
                (override));

    MOCK_METHOD(void,
                onLockConfirmed,
                (const primitives::LockEvent &),
                (override));

    MOCK_METHOD(void,
                onLockDropped,
                (const primitives::LockEvent &),
                (override));

    MOCK_METHOD(void,
                onMintConfirmed,
                (const primitives::TransferId &, const primitives::TxHash &),
                (override));

    MOCK_METHOD(void,
                onSubmissionFailed,
                (const primitives::TransferId &, std::error_code),
                (override));
  };

}  // namespace qbridge::chain
