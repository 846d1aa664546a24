/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/blob.hpp"

namespace qbridge::crypto {

  common::Hash256 sha256(std::string_view input);

  common::Hash256 sha256(common::BufferView input);

}  // namespace qbridge::crypto
