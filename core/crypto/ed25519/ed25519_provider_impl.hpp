/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/ed25519_provider.hpp"
#include "log/logger.hpp"

namespace qbridge::crypto {

  class Ed25519ProviderImpl : public Ed25519Provider {
   public:
    enum class Error {
      VERIFICATION_FAILED = 1,
      SIGN_FAILED,
    };

    Ed25519ProviderImpl();

    Ed25519Keypair generateKeypair(const Ed25519Seed &seed) const override;

    outcome::result<Ed25519Signature> sign(
        const Ed25519Keypair &keypair,
        common::BufferView message) const override;

    outcome::result<bool> verify(
        const Ed25519Signature &signature,
        common::BufferView message,
        const Ed25519PublicKey &public_key) const override;

   private:
    log::Logger logger_;
  };

}  // namespace qbridge::crypto

OUTCOME_HPP_DECLARE_ERROR(qbridge::crypto, Ed25519ProviderImpl::Error);
