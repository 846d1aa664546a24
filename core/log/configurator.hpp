/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace qbridge::log {

  /**
   * YAML configurator of the logging system. Without arguments it uses the
   * embedded configuration describing every group of the bridge engine.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    Configurator();

    explicit Configurator(std::string config);

    explicit Configurator(std::filesystem::path path);

    /// Looks for `--logcfg <path>` among command line arguments
    static std::optional<std::filesystem::path> getLogConfigFile(
        int argc, const char **argv);
  };

}  // namespace qbridge::log
