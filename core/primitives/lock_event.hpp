/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/common.hpp"

namespace qbridge::primitives {

  /// Value locked on the source ledger, to be minted on the destination one
  struct LockEvent {
    ChainId source_chain = 0;
    ChainId dest_chain = 0;
    Nonce nonce = 0;
    Address sender;
    Address recipient;
    Balance amount = 0;
    TxHash tx_hash;
    BlockNumber block_number = 0;

    bool operator==(const LockEvent &) const = default;

    TransferId transferId() const {
      return makeTransferId(source_chain, nonce);
    }

    friend scale::ScaleEncoderStream &operator<<(scale::ScaleEncoderStream &s,
                                                 const LockEvent &e) {
      return s << e.source_chain << e.dest_chain << e.nonce << e.sender
               << e.recipient << e.amount << e.tx_hash << e.block_number;
    }
  };

}  // namespace qbridge::primitives
