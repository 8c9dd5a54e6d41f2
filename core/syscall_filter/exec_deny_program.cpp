/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "syscall_filter/exec_deny_program.hpp"

namespace execlock::syscall_filter {

  ExecDenyProgram makeExecDenyProgram(const GuardedSyscalls &syscalls) {
    // https://www.kernel.org/doc/Documentation/prctl/seccomp_filter.txt
    // clang-format off
    return {
      /* 0 */ bpfStmt(kBpfLd + kBpfW + kBpfAbs, kSeccompDataArchOffset),
      /* 1 */ bpfJump(kBpfJmp + kBpfJeq + kBpfK, syscalls.arch, 0, 4),      // arch != expected: deny
      /* 2 */ bpfStmt(kBpfLd + kBpfW + kBpfAbs, kSeccompDataNrOffset),
      /* 3 */ bpfJump(kBpfJmp + kBpfJge + kBpfK, syscalls.fork, 0, 3),      // nr < fork: allow
      /* 4 */ bpfJump(kBpfJmp + kBpfJeq + kBpfK, syscalls.execveat, 1, 0),  // nr == execveat: deny
      /* 5 */ bpfJump(kBpfJmp + kBpfJgt + kBpfK, syscalls.execve, 1, 0),    // nr > execve: allow
      /* 6 */ bpfStmt(kBpfRet + kBpfK, kSeccompRetErrno | (kEacces & kSeccompRetData)),
      /* 7 */ bpfStmt(kBpfRet + kBpfK, kSeccompRetAllow),
    };
    // clang-format on
  }

}  // namespace execlock::syscall_filter
