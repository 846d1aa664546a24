/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/common.hpp"

#include <tuple>

#include "crypto/sha/sha256.hpp"

namespace qbridge::primitives {

  TransferId makeTransferId(ChainId source_chain, Nonce nonce) {
    auto encoded = scale::encode(std::tuple(source_chain, nonce)).value();
    return TransferId{crypto::sha256(encoded)};
  }

}  // namespace qbridge::primitives
