/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <vector>

#include <gtest/gtest.h>

#include "crypto/ed25519_provider.hpp"
#include "primitives/attestation.hpp"

namespace testutil {

  /**
   * Deterministic keypairs of test validators, sorted by public key. Sets
   * made with different tags share no keys.
   */
  class ValidatorKeys {
   public:
    ValidatorKeys(const qbridge::crypto::Ed25519Provider &crypto,
                  size_t count,
                  uint8_t tag = 0x42)
        : crypto_{crypto} {
      for (size_t i = 0; i < count; ++i) {
        qbridge::crypto::Ed25519Seed seed;
        seed.fill(static_cast<uint8_t>(i + 1));
        seed[0] = tag;
        keypairs_.push_back(crypto_.generateKeypair(seed));
      }
      std::sort(keypairs_.begin(),
                keypairs_.end(),
                [](const auto &lhs, const auto &rhs) {
                  return lhs.public_key < rhs.public_key;
                });
    }

    const qbridge::primitives::ValidatorId &id(size_t i) const {
      return keypairs_.at(i).public_key;
    }

    std::vector<qbridge::primitives::ValidatorId> ids() const {
      std::vector<qbridge::primitives::ValidatorId> res;
      for (const auto &keypair : keypairs_) {
        res.push_back(keypair.public_key);
      }
      return res;
    }

    size_t size() const {
      return keypairs_.size();
    }

    /// Attestation of validator `i` signed over the payload
    qbridge::primitives::Attestation attest(
        size_t i,
        const qbridge::primitives::AttestationPayload &payload,
        qbridge::clock::TimePoint at = {}) const {
      const auto &keypair = keypairs_.at(i);
      auto message = qbridge::primitives::attestationSigningMessage(payload);
      auto signature = crypto_.sign(keypair, message);
      EXPECT_TRUE(signature.has_value());
      return qbridge::primitives::Attestation{
          .validator = keypair.public_key,
          .payload = payload,
          .signature = signature.value(),
          .timestamp = at,
      };
    }

    /// Signs arbitrary bytes with the key of validator `i`
    qbridge::crypto::Ed25519Signature sign(
        size_t i, qbridge::common::BufferView message) const {
      return crypto_.sign(keypairs_.at(i), message).value();
    }

   private:
    const qbridge::crypto::Ed25519Provider &crypto_;
    std::vector<qbridge::crypto::Ed25519Keypair> keypairs_;
  };

}  // namespace testutil
