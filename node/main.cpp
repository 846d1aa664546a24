/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <sstream>

#include <soralog/logging_system.hpp>
#include <soralog/util.hpp>

#include "application/bridge_application.hpp"
#include "application/impl/app_configuration_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

using qbridge::application::AppConfigurationImpl;
using qbridge::application::BridgeApplication;
using qbridge::application::BridgeSpec;

namespace {
  int run_node(int argc, const char **argv) {
    auto configuration = std::make_shared<AppConfigurationImpl>();

    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    qbridge::log::tuneLoggingSystem(configuration->log());

    auto logger =
        qbridge::log::createLogger("Main", qbridge::log::defaultGroupName);

    auto spec = [&]() -> outcome::result<BridgeSpec> {
      if (auto path = configuration->bridgeSpecPath()) {
        return BridgeSpec::loadFrom(path->string());
      }
      std::istringstream dev_spec{
          std::string{qbridge::application::kDevBridgeSpec}};
      return BridgeSpec::loadFrom(dev_spec);
    }();
    if (spec.has_error()) {
      SL_CRITICAL(
          logger, "Bridge spec is not loaded: {}", spec.error().message());
      return EXIT_FAILURE;
    }

    auto app = std::make_shared<BridgeApplication>(configuration,
                                                   std::move(spec.value()));
    if (auto res = app->prepare(); res.has_error()) {
      SL_CRITICAL(logger, "Bridge is not prepared: {}", res.error().message());
      return EXIT_FAILURE;
    }

    SL_INFO(logger,
            "Bridge node started{}",
            configuration->isDevMode() ? " in developers mode" : "");

    app->run();

    SL_INFO(logger, "Bridge node stopped");
    logger->flush();

    return EXIT_SUCCESS;
  }
}  // namespace

int main(int argc, const char **argv) {
  soralog::util::setThreadName("qbridge");

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        qbridge::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<qbridge::log::Configurator>(
                  custom_log_config_path.value())
            : std::make_shared<qbridge::log::Configurator>();

    return std::make_shared<soralog::LoggingSystem>(std::move(configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  qbridge::log::setLoggingSystem(logging_system);

  auto exit_code = run_node(argc, argv);

  auto logger =
      qbridge::log::createLogger("Main", qbridge::log::defaultGroupName);
  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}
