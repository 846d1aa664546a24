/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <variant>

#include "primitives/common.hpp"

namespace qbridge::governance {

  struct RegisterValidator {
    primitives::ValidatorId validator;
    primitives::Balance stake = 0;

    friend scale::ScaleEncoderStream &operator<<(scale::ScaleEncoderStream &s,
                                                 const RegisterValidator &a) {
      return s << a.validator << a.stake;
    }
  };

  struct RemoveValidator {
    primitives::ValidatorId validator;

    friend scale::ScaleEncoderStream &operator<<(scale::ScaleEncoderStream &s,
                                                 const RemoveValidator &a) {
      return s << a.validator;
    }
  };

  /// Unset fields keep their current value
  struct UpdateThresholds {
    primitives::ChainId chain_id = 0;
    std::optional<uint32_t> attestation_threshold;
    std::optional<uint32_t> confirmations_required;

    friend scale::ScaleEncoderStream &operator<<(scale::ScaleEncoderStream &s,
                                                 const UpdateThresholds &a) {
      return s << a.chain_id << a.attestation_threshold
               << a.confirmations_required;
    }
  };

  struct Pause {
    friend scale::ScaleEncoderStream &operator<<(scale::ScaleEncoderStream &s,
                                                 const Pause &) {
      return s;
    }
  };

  struct Unpause {
    friend scale::ScaleEncoderStream &operator<<(scale::ScaleEncoderStream &s,
                                                 const Unpause &) {
      return s;
    }
  };

  /// Privileged operation which needs approval of several governors
  using Action = std::variant<RegisterValidator,
                              RemoveValidator,
                              UpdateThresholds,
                              Pause,
                              Unpause>;

  std::string_view actionName(const Action &action);

}  // namespace qbridge::governance
