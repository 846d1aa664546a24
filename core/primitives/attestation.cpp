/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/attestation.hpp"

namespace qbridge::primitives {

  common::Buffer attestationSigningMessage(const AttestationPayload &payload) {
    auto bytes = common::str2byte(kAttestationSigningContext);
    common::Buffer message(bytes.begin(), bytes.end());
    auto encoded = scale::encode(payload).value();
    message.insert(message.end(), encoded.begin(), encoded.end());
    return message;
  }

}  // namespace qbridge::primitives
