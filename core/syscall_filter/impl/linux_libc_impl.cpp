/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "syscall_filter/impl/linux_libc_impl.hpp"

#include <dlfcn.h>

#include <cerrno>

#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-type-vararg,hicpp-vararg)

namespace execlock::syscall_filter {

  std::shared_ptr<LinuxLibcImpl> LinuxLibcImpl::load() {
    auto prctl = ::dlsym(RTLD_DEFAULT, "prctl");
    auto syscall = ::dlsym(RTLD_DEFAULT, "syscall");
    if (prctl == nullptr or syscall == nullptr) {
      auto logger = log::createLogger("LinuxLibc", "syscall_filter");
      const char *reason = ::dlerror();
      SL_WARN(logger,
              "unable to link C library. native methods (seccomp) will be "
              "disabled: {}",
              reason != nullptr ? reason : "symbol not found");
      return nullptr;
    }
    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    return std::make_shared<LinuxLibcImpl>(
        reinterpret_cast<PrctlFn>(prctl), reinterpret_cast<SyscallFn>(syscall));
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
  }

  int LinuxLibcImpl::prctl(int option,
                           unsigned long arg2,
                           unsigned long arg3,
                           unsigned long arg4,
                           unsigned long arg5) {
    return prctl_(option, arg2, arg3, arg4, arg5);
  }

  long LinuxLibcImpl::syscall(long number,
                              unsigned long arg1,
                              unsigned long arg2,
                              unsigned long arg3) {
    return syscall_(number, arg1, arg2, arg3);
  }

  int LinuxLibcImpl::lastError() const {
    return errno;
  }

}  // namespace execlock::syscall_filter

// NOLINTEND(cppcoreguidelines-pro-type-vararg,hicpp-vararg)
