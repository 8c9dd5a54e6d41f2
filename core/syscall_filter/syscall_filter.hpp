/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>

#include "platform/platform_info.hpp"
#include "syscall_filter/linux_libc.hpp"
#include "syscall_filter/sandbox_library.hpp"
#include "syscall_filter/syscall_filter_installer.hpp"

namespace execlock::syscall_filter {

  /**
   * Picks the installer for the platform.
   * Fails with kUnsupportedPlatform on anything but Linux and macOS, before
   * any native library is touched.
   * The native libraries are only used by the installer of their platform
   * and may be nullptr.
   */
  SyscallFilterOutcome<std::unique_ptr<SyscallFilterInstaller>>
  selectInstaller(const platform::PlatformInfo &platform,
                  std::shared_ptr<LinuxLibc> libc,
                  std::shared_ptr<SandboxLibrary> sandbox);

  /// Same, linking the native library of the platform
  SyscallFilterOutcome<std::unique_ptr<SyscallFilterInstaller>>
  selectInstaller(const platform::PlatformInfo &platform);

  /**
   * Attempts to drop the ability to fork and exec for the whole process.
   *
   * Meant to run exactly once, early in process life, before anything that
   * could spawn subprocesses. A call after a successful one fails with
   * kAlreadyInstalled. There is no way to uninstall.
   */
  SyscallFilterOutcome<void> installSyscallFilter(
      const platform::PlatformInfo &platform,
      const std::filesystem::path &tmp_dir);

  SyscallFilterOutcome<void> installSyscallFilter(
      const std::filesystem::path &tmp_dir);

}  // namespace execlock::syscall_filter
