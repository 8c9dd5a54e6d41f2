/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include "syscall_filter/syscall_filter_error.hpp"

namespace execlock::syscall_filter {

  /**
   * Platform specific way to permanently deny process creation and
   * replacement (fork/exec) to the current process.
   * Success is irreversible for the lifetime of the process.
   */
  class SyscallFilterInstaller {
   public:
    virtual ~SyscallFilterInstaller() = default;

    /**
     * @param tmp_dir existing directory for transient files the installer
     * may need
     */
    virtual SyscallFilterOutcome<void> install(
        const std::filesystem::path &tmp_dir) = 0;
  };

}  // namespace execlock::syscall_filter
