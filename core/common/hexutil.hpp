/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace qbridge::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
    UNKNOWN
  };

  /**
   * @brief Converts bytes to lowercase hex representation
   */
  std::string hex_lower(BufferView bytes);

  /**
   * @brief Converts bytes to lowercase hex representation with 0x prefix
   */
  std::string hex_lower_0x(BufferView bytes);

  /**
   * @brief Converts hex representation to bytes
   * @note reads both uppercase and lowercase hexstrings
   */
  outcome::result<Buffer> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string which must start with 0x
   */
  outcome::result<Buffer> unhexWith0x(std::string_view hex);

}  // namespace qbridge::common

OUTCOME_HPP_DECLARE_ERROR(qbridge::common, UnhexError);
