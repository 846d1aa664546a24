/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include "log/logger.hpp"

namespace qbridge::application {

  class AppConfigurationImpl final : public AppConfiguration {
   public:
    AppConfigurationImpl();

    /**
     * Parses command line arguments
     * @return false when the node must not run: on error or after --help
     */
    bool initializeFromArgs(int argc, const char **argv);

    std::optional<std::filesystem::path> bridgeSpecPath() const override {
      return bridge_spec_path_;
    }

    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

    bool isDevMode() const override {
      return dev_mode_;
    }

    std::chrono::milliseconds pollInterval() const override {
      return poll_interval_;
    }

    std::chrono::milliseconds sweepInterval() const override {
      return sweep_interval_;
    }

    size_t threads() const override {
      return threads_;
    }

   private:
    log::Logger logger_;

    std::optional<std::filesystem::path> bridge_spec_path_;
    std::vector<std::string> logger_tuning_config_;
    bool dev_mode_ = false;
    std::chrono::milliseconds poll_interval_{5'000};
    std::chrono::milliseconds sweep_interval_{60'000};
    size_t threads_ = 2;
  };

}  // namespace qbridge::application
