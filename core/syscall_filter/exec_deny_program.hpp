/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>

#include "syscall_filter/bpf_program.hpp"

namespace execlock::syscall_filter {

  // seccomp filter return values, see linux/seccomp.h
  constexpr uint32_t kSeccompRetErrno = 0x00050000;
  constexpr uint32_t kSeccompRetData = 0x0000FFFF;
  constexpr uint32_t kSeccompRetAllow = 0x7FFF0000;

  // offsets of `struct seccomp_data` fields the filter reads
  constexpr uint32_t kSeccompDataNrOffset = 0x00;
  constexpr uint32_t kSeccompDataArchOffset = 0x04;

  // AUDIT_ARCH_X86_64
  constexpr uint32_t kAuditArchX86_64 = 0xC000003E;

  constexpr uint32_t kEacces = 13;

  /**
   * Syscall numbers guarded for one architecture.
   * Everything in [fork, execve] is denied, plus execveat which lies far
   * above that range.
   */
  struct GuardedSyscalls {
    uint32_t arch;
    uint32_t fork;
    uint32_t execve;
    uint32_t execveat;

    static constexpr GuardedSyscalls x86_64() {
      // 57: fork, 58: vfork, 59: execve, 322: execveat (since Linux 3.19)
      return {.arch = kAuditArchX86_64,
              .fork = 57,
              .execve = 59,
              .execveat = 322};
    }
  };

  constexpr size_t kExecDenyProgramSize = 8;

  using ExecDenyProgram = std::array<BpfInstruction, kExecDenyProgramSize>;

  /**
   * Builds the filter that makes process creation and replacement fail with
   * EACCES, and lets every other syscall through.
   * Syscalls made with a foreign architecture tag are denied.
   */
  ExecDenyProgram makeExecDenyProgram(
      const GuardedSyscalls &syscalls = GuardedSyscalls::x86_64());

}  // namespace execlock::syscall_filter
