/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <filesystem>
#include <iostream>

#include <libp2p/common/final_action.hpp>
#include <libp2p/log/configurator.hpp>
#include <soralog/util.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/syscall_filter_bootstrap.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "syscall_filter/spawn_probe.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

using execlock::application::AppConfigurationImpl;
using execlock::application::SyscallFilterBootstrap;

namespace {
  int run(int argc, const char **argv) {
    auto configuration = std::make_shared<AppConfigurationImpl>();

    if (not configuration->initializeFromArgs(argc, argv)) {
      return configuration->helpRequested() ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    execlock::log::tuneLoggingSystem(configuration->log());

    auto logger =
        execlock::log::createLogger("Main", execlock::log::defaultGroupName);

    SyscallFilterBootstrap bootstrap;
    if (auto res = bootstrap.initialize(*configuration); not res) {
      SL_CRITICAL(logger, "Startup aborted: {}", res.error());
      return EXIT_FAILURE;
    }

    if (configuration->probeSpawning()) {
      auto probe = execlock::syscall_filter::probeProcessSpawning();
      SL_INFO(logger,
              "fork: {} ({}), exec: {} ({})",
              probe.fork_denied ? "denied" : "allowed",
              probe.fork_error,
              probe.exec_denied ? "denied" : "allowed",
              probe.exec_error);
      if (bootstrap.installed() and not probe.spawningDenied()) {
        SL_ERROR(logger,
                 "Syscall filter reported as installed, "
                 "but the process can still spawn");
        return EXIT_FAILURE;
      }
    }

    SL_INFO(logger,
            "Syscall filter {}",
            bootstrap.installed() ? "installed" : "not installed");
    return EXIT_SUCCESS;
  }
}  // namespace

int main(int argc, const char **argv) {
  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  soralog::util::setThreadName("execlock");

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        execlock::log::Configurator::getLogConfigFile(argc - 1, argv + 1);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto libp2p_log_configurator =
        std::make_shared<libp2p::log::Configurator>();

    auto execlock_log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<execlock::log::Configurator>(
                  std::move(libp2p_log_configurator),
                  custom_log_config_path.value())
            : std::make_shared<execlock::log::Configurator>(
                  std::move(libp2p_log_configurator));

    return std::make_shared<soralog::LoggingSystem>(
        std::move(execlock_log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  execlock::log::setLoggingSystem(logging_system);

  return run(argc, argv);
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
