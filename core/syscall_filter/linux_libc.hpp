/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace execlock::syscall_filter {

  /**
   * Linux specific C library entry points used to install a seccomp filter.
   * Errors follow the libc convention: -1 is returned and the error code is
   * available from lastError().
   */
  class LinuxLibc {
   public:
    virtual ~LinuxLibc() = default;

    /// prctl(2)
    virtual int prctl(int option,
                      unsigned long arg2,
                      unsigned long arg3,
                      unsigned long arg4,
                      unsigned long arg5) = 0;

    /// syscall(2) with three arguments
    virtual long syscall(long number,
                         unsigned long arg1,
                         unsigned long arg2,
                         unsigned long arg3) = 0;

    /// errno left by the last failed call of this thread
    virtual int lastError() const = 0;
  };

}  // namespace execlock::syscall_filter
