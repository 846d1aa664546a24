/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

#include "common/blob.hpp"
#include "crypto/ed25519_types.hpp"

QBRIDGE_BLOB_STRICT_TYPEDEF(qbridge::primitives, TransferId, 32);
QBRIDGE_BLOB_STRICT_TYPEDEF(qbridge::primitives, TxHash, 32);

namespace qbridge::primitives {

  using ChainId = uint32_t;
  using Nonce = uint64_t;
  using BlockNumber = uint64_t;

  /// Amount in the smallest unit of the bridged token
  using Balance = uint64_t;

  /// 1 bps = 0.01%
  using BasisPoints = uint32_t;
  constexpr BasisPoints kBasisPointsDenominator = 10'000;

  /// Account on a ledger in its native textual form
  using Address = std::string;

  using ValidatorId = crypto::Ed25519PublicKey;

  /// Deterministic identity of the transfer born from a lock
  TransferId makeTransferId(ChainId source_chain, Nonce nonce);

}  // namespace qbridge::primitives
