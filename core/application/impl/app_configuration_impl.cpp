/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <iostream>

#include <boost/program_options.hpp>

namespace qbridge::application {

  AppConfigurationImpl::AppConfigurationImpl()
      : logger_{log::createLogger("AppConfiguration", "application")} {}

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<group>=<level>`, e.g. -lchain=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all groups log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "YAML file with configuration of the logging system")
        ("config,c", po::value<std::string>(), "required unless --dev, bridge spec file path")
        ;

    po::options_description runtime_desc("Runtime options");
    runtime_desc.add_options()
        ("poll-interval", po::value<uint32_t>()->default_value(5'000), "period of chain watch loops <ms>")
        ("sweep-interval", po::value<uint32_t>()->default_value(60'000), "period of expiry and slashing sweeps <ms>")
        ("threads", po::value<uint32_t>()->default_value(2), "number of worker threads")
        ;

    po::options_description development_desc("Additional options");
    development_desc.add_options()
        ("dev", "if option specified then in-memory ledgers and local validators are used")
        ;
    // clang-format on

    desc.add(runtime_desc).add(development_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    if (auto it = vm.find("log"); it != vm.end()) {
      logger_tuning_config_ = it->second.as<std::vector<std::string>>();
    }

    dev_mode_ = vm.count("dev") > 0;

    if (auto it = vm.find("config"); it != vm.end()) {
      bridge_spec_path_ = it->second.as<std::string>();
      if (not std::filesystem::is_regular_file(*bridge_spec_path_)) {
        SL_ERROR(logger_,
                 "Bridge spec file {} does not exist",
                 bridge_spec_path_->string());
        return false;
      }
    } else if (not dev_mode_) {
      SL_ERROR(logger_, "Bridge spec is required, use --config or --dev");
      return false;
    }

    poll_interval_ =
        std::chrono::milliseconds{vm["poll-interval"].as<uint32_t>()};
    sweep_interval_ =
        std::chrono::milliseconds{vm["sweep-interval"].as<uint32_t>()};
    threads_ = std::max<uint32_t>(1, vm["threads"].as<uint32_t>());
    if (poll_interval_.count() == 0 or sweep_interval_.count() == 0) {
      SL_ERROR(logger_, "Intervals must be positive");
      return false;
    }

    return true;
  }

}  // namespace qbridge::application
