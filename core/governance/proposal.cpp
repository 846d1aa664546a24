/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "governance/proposal.hpp"

namespace qbridge::governance {

  namespace {
    template <class... Ts>
    struct overloaded : Ts... {
      using Ts::operator()...;
    };
  }  // namespace

  std::string_view actionName(const Action &action) {
    return std::visit(
        overloaded{
            [](const RegisterValidator &) { return "register-validator"; },
            [](const RemoveValidator &) { return "remove-validator"; },
            [](const UpdateThresholds &) { return "update-thresholds"; },
            [](const Pause &) { return "pause"; },
            [](const Unpause &) { return "unpause"; },
        },
        action);
  }

  common::Buffer approvalSigningMessage(ProposalId id, const Action &action) {
    auto bytes = common::str2byte(kApprovalSigningContext);
    common::Buffer message(bytes.begin(), bytes.end());
    auto encoded = scale::encode(id, action).value();
    message.insert(message.end(), encoded.begin(), encoded.end());
    return message;
  }

}  // namespace qbridge::governance
