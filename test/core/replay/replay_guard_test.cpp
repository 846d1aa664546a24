/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "replay/replay_guard.hpp"

#include <atomic>
#include <thread>

#include <gtest/gtest.h>

#include "testutil/prepare_loggers.hpp"

using qbridge::primitives::makeTransferId;
using qbridge::primitives::TransferStatus;
using qbridge::replay::ReplayGuard;

class ReplayGuardTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  ReplayGuard guard;
  qbridge::primitives::TransferId id = makeTransferId(1, 1);
};

/**
 * @given fresh transfer
 * @when it moves through the attestation phase
 * @then transitions are admitted and the transfer is not settled
 */
TEST_F(ReplayGuardTest, PendingTransitionsAreNotMarked) {
  EXPECT_TRUE(guard.admit(id, TransferStatus::Confirmed));
  EXPECT_TRUE(guard.admit(id, TransferStatus::Attesting));
  EXPECT_TRUE(guard.admit(id, TransferStatus::Disputed));
  EXPECT_TRUE(guard.admit(id, TransferStatus::Attesting));
  EXPECT_FALSE(guard.isSettled(id));
  EXPECT_FALSE(guard.mark(id).has_value());
}

/**
 * @given finalized transfer
 * @when it is finalized again, expired, completed twice
 * @then only the first completion is admitted
 */
TEST_F(ReplayGuardTest, FinalizedOnlyCompletesOnce) {
  EXPECT_TRUE(guard.admit(id, TransferStatus::Finalized));
  EXPECT_TRUE(guard.isSettled(id));

  EXPECT_FALSE(guard.admit(id, TransferStatus::Finalized));
  EXPECT_FALSE(guard.admit(id, TransferStatus::Expired));
  EXPECT_FALSE(guard.admit(id, TransferStatus::Refunded));
  EXPECT_TRUE(guard.admit(id, TransferStatus::Completed));
  EXPECT_FALSE(guard.admit(id, TransferStatus::Completed));
  EXPECT_EQ(guard.mark(id), TransferStatus::Completed);
}

/**
 * @given expired transfer
 * @when it is finalized or refunded
 * @then it can be refunded once and never finalized
 */
TEST_F(ReplayGuardTest, ExpiredOnlyRefundsOnce) {
  EXPECT_TRUE(guard.admit(id, TransferStatus::Expired));
  EXPECT_FALSE(guard.admit(id, TransferStatus::Finalized));
  EXPECT_FALSE(guard.admit(id, TransferStatus::Attesting));
  EXPECT_TRUE(guard.admit(id, TransferStatus::Refunded));
  EXPECT_FALSE(guard.admit(id, TransferStatus::Refunded));
}

/**
 * @given many threads finalizing the same transfer at once
 * @when they race through the guard
 * @then exactly one is admitted
 */
TEST_F(ReplayGuardTest, ConcurrentFinalizationAdmittedOnce) {
  std::atomic_size_t admitted = 0;
  std::vector<std::thread> threads;
  for (size_t i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (guard.admit(id, TransferStatus::Finalized)) {
        ++admitted;
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  EXPECT_EQ(admitted.load(), 1);
}
