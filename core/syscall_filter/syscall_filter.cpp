/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "syscall_filter/syscall_filter.hpp"

#include <atomic>

#include <fmt/format.h>

#include "syscall_filter/impl/linux_libc_impl.hpp"
#include "syscall_filter/impl/sandbox_library_impl.hpp"
#include "syscall_filter/impl/seatbelt_installer.hpp"
#include "syscall_filter/impl/seccomp_installer.hpp"

namespace execlock::syscall_filter {

  namespace {
    // the filter is process wide kernel state
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::atomic_bool installed{false};
  }  // namespace

  SyscallFilterOutcome<std::unique_ptr<SyscallFilterInstaller>>
  selectInstaller(const platform::PlatformInfo &platform,
                  std::shared_ptr<LinuxLibc> libc,
                  std::shared_ptr<SandboxLibrary> sandbox) {
    switch (platform.os) {
      case platform::OsFamily::kLinux:
        return std::make_unique<SeccompInstaller>(platform, std::move(libc));
      case platform::OsFamily::kMacOs:
        return std::make_unique<SeatbeltInstaller>(std::move(sandbox));
      case platform::OsFamily::kOther:
        break;
    }
    return SyscallFilterError{SyscallFilterErrc::kUnsupportedPlatform,
                              "select installer",
                              0,
                              fmt::format("'{}'", platform.os_name)};
  }

  SyscallFilterOutcome<std::unique_ptr<SyscallFilterInstaller>>
  selectInstaller(const platform::PlatformInfo &platform) {
    switch (platform.os) {
      case platform::OsFamily::kLinux:
        return selectInstaller(platform, LinuxLibcImpl::load(), nullptr);
      case platform::OsFamily::kMacOs:
        return selectInstaller(platform, nullptr, SandboxLibraryImpl::load());
      case platform::OsFamily::kOther:
        break;
    }
    return selectInstaller(platform, nullptr, nullptr);
  }

  SyscallFilterOutcome<void> installSyscallFilter(
      const platform::PlatformInfo &platform,
      const std::filesystem::path &tmp_dir) {
    if (installed.exchange(true)) {
      return SyscallFilterError{SyscallFilterErrc::kAlreadyInstalled,
                                "install syscall filter"};
    }
    auto res = [&]() -> SyscallFilterOutcome<void> {
      auto installer = selectInstaller(platform);
      if (not installer) {
        return installer.error();
      }
      return installer.value()->install(tmp_dir);
    }();
    if (not res) {
      installed = false;
    }
    return res;
  }

  SyscallFilterOutcome<void> installSyscallFilter(
      const std::filesystem::path &tmp_dir) {
    return installSyscallFilter(platform::PlatformInfo::current(), tmp_dir);
  }

}  // namespace execlock::syscall_filter
