/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/syscall_filter_bootstrap.hpp"

#include "syscall_filter/syscall_filter.hpp"

namespace execlock::application {

  SyscallFilterBootstrap::SyscallFilterBootstrap()
      : SyscallFilterBootstrap{[](const std::filesystem::path &tmp_dir) {
          return syscall_filter::installSyscallFilter(tmp_dir);
        }} {}

  SyscallFilterBootstrap::SyscallFilterBootstrap(Install install)
      : install_{std::move(install)},
        logger_{log::createLogger("SyscallFilterBootstrap", "application")} {}

  syscall_filter::SyscallFilterOutcome<void> SyscallFilterBootstrap::initialize(
      const AppConfiguration &config) {
    if (not config.syscallFilterEnabled()) {
      SL_INFO(logger_, "Syscall filter disabled in configuration");
      return outcome::success();
    }
    if (installed_) {
      return syscall_filter::SyscallFilterError{
          syscall_filter::SyscallFilterErrc::kAlreadyInstalled,
          "bootstrap"};
    }

    auto res = install_(config.tmpDir());
    if (res) {
      installed_ = true;
      SL_VERBOSE(logger_, "Fork and exec are denied to this process");
      return outcome::success();
    }
    if (config.syscallFilterEnforced()) {
      SL_ERROR(logger_, "unable to install syscall filter: {}", res.error());
      return res;
    }
    SL_WARN(logger_, "unable to install syscall filter: {}", res.error());
    return outcome::success();
  }

}  // namespace execlock::application
