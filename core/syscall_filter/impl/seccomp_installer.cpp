/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "syscall_filter/impl/seccomp_installer.hpp"

#include <cerrno>

#include <fmt/format.h>

#include "syscall_filter/bpf_program.hpp"
#include "syscall_filter/exec_deny_program.hpp"

namespace execlock::syscall_filter {

  SeccompInstaller::SeccompInstaller(platform::PlatformInfo platform,
                                     std::shared_ptr<LinuxLibc> libc)
      : platform_{std::move(platform)},
        libc_{std::move(libc)},
        log_{log::createLogger("Seccomp", "syscall_filter")} {}

  SyscallFilterError SeccompInstaller::lastError(SyscallFilterErrc code,
                                                 std::string stage) const {
    return SyscallFilterError{code, std::move(stage), libc_->lastError()};
  }

  SyscallFilterOutcome<void> SeccompInstaller::install(
      const std::filesystem::path &) {
    // syscall numbers and the arch tag in the filter are x86_64 specific
    if (not platform_.isX86_64()) {
      return SyscallFilterError{SyscallFilterErrc::kUnsupportedArchitecture,
                                "seccomp",
                                0,
                                fmt::format("'{}'", platform_.arch)};
    }

    // could be some really ancient kernel or a broken libc
    if (libc_ == nullptr) {
      return SyscallFilterError{SyscallFilterErrc::kBridgeUnavailable,
                                "seccomp",
                                0,
                                "requires kernel 3.5+ with CONFIG_SECCOMP and "
                                "CONFIG_SECCOMP_FILTER compiled in"};
    }

    if (auto res = probe(); not res) {
      return res;
    }

    // needed to be able to set a seccomp filter as ordinary user
    if (libc_->prctl(kPrSetNoNewPrivs, 1, 0, 0, 0) < 0) {
      return lastError(SyscallFilterErrc::kUnknownError,
                       "prctl(PR_SET_NO_NEW_PRIVS)");
    }

    if (auto res = loadFilter(); not res) {
      return res;
    }

    // we should be in filter mode now
    auto mode = libc_->prctl(kPrGetSeccomp, 0, 0, 0, 0);
    if (mode != kSeccompModeFilter) {
      return SyscallFilterError{SyscallFilterErrc::kVerificationFailed,
                                "prctl(PR_GET_SECCOMP)",
                                mode < 0 ? libc_->lastError() : 0,
                                fmt::format("seccomp mode {}", mode)};
    }

    SL_DEBUG(log_, "Linux seccomp filter installation successful");
    return outcome::success();
  }

  SyscallFilterOutcome<void> SeccompInstaller::probe() {
    // some of these features get backported, the kernel version is not
    // checked on purpose
    if (libc_->prctl(kPrGetNoNewPrivs, 0, 0, 0, 0) < 0) {
      auto err = libc_->lastError();
      if (err == ENOSYS) {
        return lastError(SyscallFilterErrc::kKernelTooOld,
                         "prctl(PR_GET_NO_NEW_PRIVS)");
      }
      return lastError(SyscallFilterErrc::kUnknownError,
                       "prctl(PR_GET_NO_NEW_PRIVS)");
    }

    auto mode = libc_->prctl(kPrGetSeccomp, 0, 0, 0, 0);
    if (mode < 0) {
      auto err = libc_->lastError();
      if (err == EINVAL) {
        return SyscallFilterError{SyscallFilterErrc::kFeatureNotCompiled,
                                  "prctl(PR_GET_SECCOMP)",
                                  err,
                                  "CONFIG_SECCOMP not compiled into kernel"};
      }
      return lastError(SyscallFilterErrc::kUnknownError,
                       "prctl(PR_GET_SECCOMP)");
    }
    if (mode == kSeccompModeFilter) {
      return SyscallFilterError{SyscallFilterErrc::kAlreadyInstalled,
                                "prctl(PR_GET_SECCOMP)"};
    }

    // a null filter is rejected with EFAULT only when filter mode exists
    if (libc_->prctl(kPrSetSeccomp, kSeccompModeFilter, 0, 0, 0) < 0) {
      auto err = libc_->lastError();
      switch (err) {
        case EFAULT:
          break;
        case EINVAL:
          return SyscallFilterError{
              SyscallFilterErrc::kFeatureNotCompiled,
              "prctl(PR_SET_SECCOMP)",
              err,
              "CONFIG_SECCOMP_FILTER not compiled into kernel"};
        default:
          return lastError(SyscallFilterErrc::kUnknownError,
                           "prctl(PR_SET_SECCOMP)");
      }
    }
    return outcome::success();
  }

  SyscallFilterOutcome<void> SeccompInstaller::loadFilter() {
    auto program = makeExecDenyProgram(GuardedSyscalls::x86_64());
    auto encoded = EncodedBpfProgram::encode(program);
    auto fprog = encoded.fprog();
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    auto fprog_arg = reinterpret_cast<unsigned long>(&fprog);

    // no going back if this works
    if (libc_->syscall(kSysSeccompX86_64,
                       kSeccompSetModeFilter,
                       kSeccompFilterFlagTsync,
                       fprog_arg)
        == 0) {
      return outcome::success();
    }
    auto seccomp_error = libc_->lastError();
    SL_DEBUG(log_,
             "seccomp(SECCOMP_SET_MODE_FILTER): {}, falling back to "
             "prctl(PR_SET_SECCOMP)...",
             describeErrno(seccomp_error));

    // only the calling thread is covered from here on
    if (libc_->prctl(kPrSetSeccomp, kSeccompModeFilter, fprog_arg, 0, 0) < 0) {
      auto prctl_error = libc_->lastError();
      return SyscallFilterError{
          SyscallFilterErrc::kUnknownError,
          "prctl(PR_SET_SECCOMP)",
          prctl_error,
          fmt::format("seccomp(SECCOMP_SET_MODE_FILTER): {} (errno {})",
                      describeErrno(seccomp_error),
                      seccomp_error)};
    }
    return outcome::success();
  }

}  // namespace execlock::syscall_filter
