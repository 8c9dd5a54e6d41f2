/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <functional>

#include "application/app_configuration.hpp"
#include "log/logger.hpp"
#include "syscall_filter/syscall_filter_error.hpp"

namespace execlock::application {

  /**
   * Startup step that drops the ability to fork and exec, according to
   * configuration, and remembers whether it succeeded.
   */
  class SyscallFilterBootstrap {
   public:
    using Install = std::function<syscall_filter::SyscallFilterOutcome<void>(
        const std::filesystem::path &)>;

    SyscallFilterBootstrap();

    /// @param install replaces the platform installer
    explicit SyscallFilterBootstrap(Install install);

    /**
     * When the filter is enabled and can't be installed, the failure is
     * returned if it is enforced, and only logged otherwise.
     */
    syscall_filter::SyscallFilterOutcome<void> initialize(
        const AppConfiguration &config);

    /// Whether fork and exec are denied to this process
    bool installed() const {
      return installed_;
    }

   private:
    Install install_;
    bool installed_ = false;
    log::Logger logger_;
  };

}  // namespace execlock::application
