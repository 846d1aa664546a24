/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "clock/clock.hpp"
#include "primitives/lock_event.hpp"

namespace qbridge::primitives {

  /// Statement a validator signs about a lock
  struct AttestationPayload {
    TransferId transfer_id;
    ChainId source_chain = 0;
    ChainId dest_chain = 0;
    Address recipient;
    Balance amount = 0;
    Nonce nonce = 0;

    bool operator==(const AttestationPayload &) const = default;

    static AttestationPayload fromLock(const LockEvent &lock) {
      return AttestationPayload{.transfer_id = lock.transferId(),
                                .source_chain = lock.source_chain,
                                .dest_chain = lock.dest_chain,
                                .recipient = lock.recipient,
                                .amount = lock.amount,
                                .nonce = lock.nonce};
    }

    friend scale::ScaleEncoderStream &operator<<(
        scale::ScaleEncoderStream &s, const AttestationPayload &p) {
      return s << p.transfer_id << p.source_chain << p.dest_chain
               << p.recipient << p.amount << p.nonce;
    }
  };

  /// Domain separation of attestation signatures
  constexpr std::string_view kAttestationSigningContext = "qbridge/attest/v1";

  /// Bytes a validator signs: the context followed by the encoded payload
  common::Buffer attestationSigningMessage(const AttestationPayload &payload);

  struct Attestation {
    ValidatorId validator;
    AttestationPayload payload;
    crypto::Ed25519Signature signature;
    clock::TimePoint timestamp;

    bool operator==(const Attestation &) const = default;
  };

  /**
   * Proof handed to the destination ledger: the first threshold-many accepted
   * attestations, ordered by validator id
   */
  struct ProofBundle {
    TransferId transfer_id;
    std::vector<Attestation> attestations;
  };

  /// Mint request submitted to the destination ledger
  struct MintOrder {
    TransferId transfer_id;
    ChainId dest_chain = 0;
    Address recipient;
    Balance amount = 0;
    ProofBundle proof;
  };

}  // namespace qbridge::primitives
