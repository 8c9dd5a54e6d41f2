/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <iostream>

#include <boost/program_options.hpp>

namespace {
  namespace fs = std::filesystem;

  std::filesystem::path defaultTmpDir() {
    std::error_code ec;
    auto path = fs::temp_directory_path(ec);
    return ec ? fs::path{"/tmp"} : path;
  }

  const bool def_syscall_filter = true;
}  // namespace

namespace execlock::application {

  AppConfigurationImpl::AppConfigurationImpl()
      : tmpDir_{defaultTmpDir()},
        syscallFilterEnabled_{def_syscall_filter},
        syscallFilterEnforced_{false},
        probeSpawning_{false},
        helpRequested_{false},
        logger_{log::createLogger("AppConfiguration", "application")} {}

  bool AppConfigurationImpl::validate_config() const {
    std::error_code ec;
    if (not fs::is_directory(tmpDir_, ec)) {
      SL_ERROR(logger_,
               "Temporary directory {} does not exist, "
               "please specify a valid path with --tmp-dir option",
               tmpDir_.native());
      return false;
    }
    if (syscallFilterEnforced_ and not syscallFilterEnabled_) {
      SL_ERROR(logger_,
               "--enforce-syscall-filter requires the syscall filter, "
               "remove --syscall-filter false");
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g. -llibp2p=off or just <level>.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all to 'info', libp2p to 'off'.")
        ("logcfg", po::value<std::string>(), "Path to YAML logging configuration")
        ;

    po::options_description filter_desc("Syscall filter options");
    filter_desc.add_options()
        ("syscall-filter", po::value<bool>()->default_value(def_syscall_filter),
          "deny fork and exec to the process at startup")
        ("enforce-syscall-filter", po::bool_switch(),
          "fail startup if the syscall filter cannot be installed")
        ("tmp-dir", po::value<std::string>(),
          "directory for transient files, default is the system temporary directory")
        ("probe", po::bool_switch(),
          "check after startup that fork and exec are denied")
        ;
    // clang-format on

    desc.add(filter_desc);

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
      helpRequested_ = true;
      return false;
    }

    if (auto it = vm.find("log"); it != vm.end()) {
      log_ = it->second.as<std::vector<std::string>>();
    }
    if (auto it = vm.find("logcfg"); it != vm.end()) {
      logConfigFile_ = it->second.as<std::string>();
    }
    if (auto it = vm.find("tmp-dir"); it != vm.end()) {
      tmpDir_ = it->second.as<std::string>();
    }
    syscallFilterEnabled_ = vm["syscall-filter"].as<bool>();
    syscallFilterEnforced_ = vm["enforce-syscall-filter"].as<bool>();
    probeSpawning_ = vm["probe"].as<bool>();

    if (not validate_config()) {
      std::cout << desc << std::endl;
      return false;
    }
    return true;
  }

}  // namespace execlock::application
