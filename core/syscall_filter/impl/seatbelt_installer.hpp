/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "syscall_filter/syscall_filter_installer.hpp"

#include <memory>
#include <string>
#include <string_view>

#include "log/logger.hpp"
#include "syscall_filter/sandbox_library.hpp"

namespace execlock::syscall_filter {

  /// Allow everything except process fork and execution
  constexpr std::string_view kSeatbeltRules =
      "(version 1) (allow default) (deny process-fork) (deny process-exec)";

  /**
   * Installs a custom sandbox(7) profile on macOS Leopard or above.
   * The profile is passed to sandbox_init() through a transient file in the
   * given directory, which is removed before install() returns.
   */
  class SeatbeltInstaller final : public SyscallFilterInstaller {
   public:
    /// @param sandbox nullptr if the sandbox library could not be linked
    explicit SeatbeltInstaller(std::shared_ptr<SandboxLibrary> sandbox,
                               std::string rules = std::string{kSeatbeltRules});

    SyscallFilterOutcome<void> install(
        const std::filesystem::path &tmp_dir) override;

   private:
    SyscallFilterOutcome<void> initProfile(const std::filesystem::path &path);

    std::shared_ptr<SandboxLibrary> sandbox_;
    std::string rules_;
    log::Logger log_;
  };

}  // namespace execlock::syscall_filter
