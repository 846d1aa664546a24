/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(qbridge::common, BlobError, e) {
  using qbridge::common::BlobError;
  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Input string has incorrect length, not matching the blob size";
  }
  return "Unknown error";
}

namespace qbridge::common {

  template class Blob<32ul>;
  template class Blob<64ul>;

}  // namespace qbridge::common
