/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "syscall_filter/syscall_filter_installer.hpp"

#include <memory>

#include "log/logger.hpp"
#include "platform/platform_info.hpp"
#include "syscall_filter/linux_libc.hpp"

namespace execlock::syscall_filter {

  // prctl(2) options
  constexpr int kPrGetSeccomp = 21;       // since Linux 2.6.23
  constexpr int kPrSetSeccomp = 22;       // since Linux 2.6.23
  constexpr int kPrSetNoNewPrivs = 38;    // since Linux 3.5
  constexpr int kPrGetNoNewPrivs = 39;    // since Linux 3.5
  constexpr int kSeccompModeFilter = 2;   // since Linux 3.5

  // seccomp(2), x86_64 only
  constexpr long kSysSeccompX86_64 = 317;        // since Linux 3.17
  constexpr int kSeccompSetModeFilter = 1;       // since Linux 3.17
  constexpr int kSeccompFilterFlagTsync = 1;     // since Linux 3.17

  /**
   * Installs a seccomp BPF filter returning EACCES for fork, vfork, execve
   * and execveat.
   *
   * Supported on x86_64 Linux 3.5+ with CONFIG_SECCOMP and
   * CONFIG_SECCOMP_FILTER. seccomp(2) with SECCOMP_FILTER_FLAG_TSYNC (3.17+)
   * is preferred as it covers every existing thread of the process;
   * otherwise prctl(PR_SET_SECCOMP) is used, which covers only the calling
   * thread and threads it creates afterwards.
   */
  class SeccompInstaller final : public SyscallFilterInstaller {
   public:
    /// @param libc nullptr if the C library could not be linked
    SeccompInstaller(platform::PlatformInfo platform,
                     std::shared_ptr<LinuxLibc> libc);

    SyscallFilterOutcome<void> install(
        const std::filesystem::path &tmp_dir) override;

   private:
    /// Checks kernel support without changing any process state
    SyscallFilterOutcome<void> probe();

    SyscallFilterOutcome<void> loadFilter();

    SyscallFilterError lastError(SyscallFilterErrc code,
                                 std::string stage) const;

    platform::PlatformInfo platform_;
    std::shared_ptr<LinuxLibc> libc_;
    log::Logger log_;
  };

}  // namespace execlock::syscall_filter
