/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/dev_validators.hpp"

#include <boost/assert.hpp>

namespace qbridge::application {

  DevValidators::DevValidators(
      size_t count,
      std::shared_ptr<crypto::Ed25519Provider> crypto,
      std::shared_ptr<clock::SystemClock> clock,
      std::weak_ptr<transfer::TransferStateMachine> transfers)
      : crypto_{std::move(crypto)},
        clock_{std::move(clock)},
        transfers_{std::move(transfers)},
        logger_{log::createLogger("DevValidators", "application")} {
    BOOST_ASSERT(crypto_);
    BOOST_ASSERT(clock_);
    for (size_t i = 0; i < count; ++i) {
      crypto::Ed25519Seed seed;
      seed.fill(static_cast<uint8_t>(i + 1));
      keypairs_.push_back(crypto_->generateKeypair(seed));
    }
  }

  void DevValidators::onLockConfirmed(const primitives::LockEvent &lock) {
    auto transfers = transfers_.lock();
    if (not transfers) {
      return;
    }
    auto payload = primitives::AttestationPayload::fromLock(lock);
    auto message = primitives::attestationSigningMessage(payload);
    for (const auto &keypair : keypairs_) {
      auto signature = crypto_->sign(keypair, message);
      if (signature.has_error()) {
        SL_ERROR(logger_,
                 "Validator {} can't sign: {}",
                 keypair.public_key,
                 signature.error().message());
        continue;
      }
      auto res = transfers->submitAttestation(
          primitives::Attestation{.validator = keypair.public_key,
                                  .payload = payload,
                                  .signature = signature.value(),
                                  .timestamp = clock_->now()});
      if (res.has_error()) {
        SL_DEBUG(logger_,
                 "Attestation of {} by {} dropped: {}",
                 payload.transfer_id,
                 keypair.public_key,
                 res.error().message());
        continue;
      }
      SL_DEBUG(logger_,
               "Attestation of {} by {}: {}",
               payload.transfer_id,
               keypair.public_key,
               res.value());
    }
  }

}  // namespace qbridge::application
