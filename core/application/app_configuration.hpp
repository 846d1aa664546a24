/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace qbridge::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /// Bridge spec file, none in developers mode without --config
    virtual std::optional<std::filesystem::path> bridgeSpecPath() const = 0;

    /// Logging filters in `<group>=<level>` form
    virtual const std::vector<std::string> &log() const = 0;

    /// In-memory ledgers and locally signing validators
    virtual bool isDevMode() const = 0;

    /// Period of a chain watch loop
    virtual std::chrono::milliseconds pollInterval() const = 0;

    /// Period of expiry, slashing, decay and health sweeps
    virtual std::chrono::milliseconds sweepInterval() const = 0;

    virtual size_t threads() const = 0;
  };

}  // namespace qbridge::application
