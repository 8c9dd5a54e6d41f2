/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "syscall_filter/linux_libc.hpp"

#include <memory>

namespace execlock::syscall_filter {

  class LinuxLibcImpl final : public LinuxLibc {
   public:
    using PrctlFn = int (*)(int, ...);
    using SyscallFn = long (*)(long, ...);

    /**
     * Resolves the entry points in the already loaded C library.
     * @return nullptr when they are missing, e.g. on a non-Linux system
     */
    static std::shared_ptr<LinuxLibcImpl> load();

    LinuxLibcImpl(PrctlFn prctl, SyscallFn syscall)
        : prctl_{prctl}, syscall_{syscall} {}

    int prctl(int option,
              unsigned long arg2,
              unsigned long arg3,
              unsigned long arg4,
              unsigned long arg5) override;

    long syscall(long number,
                 unsigned long arg1,
                 unsigned long arg2,
                 unsigned long arg3) override;

    int lastError() const override;

   private:
    PrctlFn prctl_;
    SyscallFn syscall_;
  };

}  // namespace execlock::syscall_filter
