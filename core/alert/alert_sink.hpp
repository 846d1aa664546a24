/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "alert/alert.hpp"

namespace qbridge::alert {

  /**
   * Receiver of operator alerts. Must not block the caller.
   */
  class AlertSink {
   public:
    virtual ~AlertSink() = default;

    virtual void raise(Alert alert) = 0;
  };

}  // namespace qbridge::alert
