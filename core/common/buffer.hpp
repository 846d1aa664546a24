/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace qbridge::common {

  using Buffer = std::vector<uint8_t>;
  using BufferView = std::span<const uint8_t>;

  inline BufferView str2byte(std::string_view str) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const uint8_t *>(str.data()), str.size()};
  }

}  // namespace qbridge::common
