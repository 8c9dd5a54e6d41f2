/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "syscall_filter/exec_deny_program.hpp"

#include <gtest/gtest.h>

#include "testutil/syscall_filter/bpf_interpreter.hpp"

using execlock::syscall_filter::GuardedSyscalls;
using execlock::syscall_filter::kAuditArchX86_64;
using execlock::syscall_filter::kSeccompRetAllow;
using execlock::syscall_filter::kSeccompRetErrno;
using execlock::syscall_filter::makeExecDenyProgram;
using testutil::runBpf;
using testutil::SeccompData;

namespace {
  constexpr uint32_t kDenyWithEacces = kSeccompRetErrno | 13;

  // AUDIT_ARCH_I386 and AUDIT_ARCH_AARCH64
  constexpr uint32_t kAuditArchI386 = 0x40000003;
  constexpr uint32_t kAuditArchAarch64 = 0xC00000B7;
}  // namespace

class ExecDenyProgramTest : public ::testing::Test {
 protected:
  std::optional<uint32_t> run(uint32_t nr, uint32_t arch = kAuditArchX86_64) {
    return runBpf(program_, SeccompData{.nr = nr, .arch = arch});
  }

  GuardedSyscalls syscalls_ = GuardedSyscalls::x86_64();
  execlock::syscall_filter::ExecDenyProgram program_ =
      makeExecDenyProgram(syscalls_);
};

/**
 * @given the x86_64 syscall table
 * @then fork, vfork, execve and execveat are the guarded numbers
 */
TEST_F(ExecDenyProgramTest, GuardedNumbers) {
  EXPECT_EQ(syscalls_.arch, 0xC000003E);
  EXPECT_EQ(syscalls_.fork, 57);
  EXPECT_EQ(syscalls_.execve, 59);
  EXPECT_EQ(syscalls_.execveat, 322);
  EXPECT_EQ(program_.size(), 8u);
}

/**
 * @given the x86_64 architecture tag
 * @when fork, vfork, execve or execveat is evaluated
 * @then the filter returns EACCES
 */
TEST_F(ExecDenyProgramTest, DeniesProcessCreation) {
  for (uint32_t nr : {57u, 58u, 59u, 322u}) {
    EXPECT_EQ(run(nr), kDenyWithEacces) << "syscall " << nr;
  }
}

/**
 * @given the x86_64 architecture tag
 * @when any syscall number up to well past execveat is evaluated
 * @then it is denied exactly when it is in [fork, execve] or is execveat
 */
TEST_F(ExecDenyProgramTest, AllowsEverythingElse) {
  for (uint32_t nr = 0; nr < 1024; ++nr) {
    bool guarded =
        (nr >= syscalls_.fork and nr <= syscalls_.execve)
        or nr == syscalls_.execveat;
    EXPECT_EQ(run(nr), guarded ? kDenyWithEacces : kSeccompRetAllow)
        << "syscall " << nr;
  }
}

/**
 * @given syscall numbers around the edges of the guarded range
 * @then the neighbours of the range and of execveat are allowed
 */
TEST_F(ExecDenyProgramTest, RangeEdges) {
  EXPECT_EQ(run(56), kSeccompRetAllow);
  EXPECT_EQ(run(60), kSeccompRetAllow);
  EXPECT_EQ(run(321), kSeccompRetAllow);
  EXPECT_EQ(run(323), kSeccompRetAllow);
  EXPECT_EQ(run(0xFFFFFFFF), kSeccompRetAllow);
}

/**
 * @given a foreign architecture tag
 * @when any syscall is evaluated
 * @then it is always denied, the number is not even looked at
 */
TEST_F(ExecDenyProgramTest, ForeignArchitectureIsDenied) {
  for (uint32_t arch : {kAuditArchI386, kAuditArchAarch64, 0u}) {
    for (uint32_t nr : {0u, 1u, 56u, 57u, 59u, 60u, 322u, 400u}) {
      EXPECT_EQ(run(nr, arch), kDenyWithEacces)
          << "arch " << arch << " syscall " << nr;
    }
  }
}

/**
 * @given a table with different numbers
 * @when a program is built from it
 * @then the same shape guards the new numbers
 */
TEST(ExecDenyProgramCustomTableTest, FollowsTable) {
  GuardedSyscalls syscalls{
      .arch = 0x12345678, .fork = 100, .execve = 105, .execveat = 200};
  auto program = makeExecDenyProgram(syscalls);
  auto run = [&](uint32_t nr) {
    return runBpf(program, SeccompData{.nr = nr, .arch = syscalls.arch});
  };
  EXPECT_EQ(run(99), kSeccompRetAllow);
  EXPECT_EQ(run(100), kDenyWithEacces);
  EXPECT_EQ(run(103), kDenyWithEacces);
  EXPECT_EQ(run(105), kDenyWithEacces);
  EXPECT_EQ(run(106), kSeccompRetAllow);
  EXPECT_EQ(run(200), kDenyWithEacces);
  EXPECT_EQ(run(57), kSeccompRetAllow);
}
