/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/ed25519_types.hpp"
#include "outcome/outcome.hpp"

namespace qbridge::crypto {

  /**
   * Signature scheme of validators and governors. Validators sign with their
   * own keys outside of the engine, the engine only verifies.
   */
  class Ed25519Provider {
   public:
    virtual ~Ed25519Provider() = default;

    virtual Ed25519Keypair generateKeypair(const Ed25519Seed &seed) const = 0;

    virtual outcome::result<Ed25519Signature> sign(
        const Ed25519Keypair &keypair, common::BufferView message) const = 0;

    /**
     * @return true for a valid signature, false for a wrong one, error on
     * internal failure of the library
     */
    virtual outcome::result<bool> verify(
        const Ed25519Signature &signature,
        common::BufferView message,
        const Ed25519PublicKey &public_key) const = 0;
  };

}  // namespace qbridge::crypto
