/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <openssl/evp.h>

namespace qbridge::crypto {

  common::Hash256 sha256(std::string_view input) {
    return sha256(common::str2byte(input));
  }

  common::Hash256 sha256(common::BufferView input) {
    common::Hash256 out;
    unsigned int out_size = 0;
    EVP_Digest(input.data(),
               input.size(),
               out.data(),
               &out_size,
               EVP_sha256(),
               nullptr);
    return out;
  }

}  // namespace qbridge::crypto
