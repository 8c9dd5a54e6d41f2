/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "syscall_filter/syscall_filter.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mock/core/syscall_filter/linux_libc_mock.hpp"
#include "mock/core/syscall_filter/sandbox_library_mock.hpp"
#include "syscall_filter/impl/seatbelt_installer.hpp"
#include "syscall_filter/impl/seccomp_installer.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using execlock::platform::OsFamily;
using execlock::platform::PlatformInfo;
using execlock::syscall_filter::installSyscallFilter;
using execlock::syscall_filter::LinuxLibcMock;
using execlock::syscall_filter::SandboxLibraryMock;
using execlock::syscall_filter::SeatbeltInstaller;
using execlock::syscall_filter::SeccompInstaller;
using execlock::syscall_filter::selectInstaller;
using execlock::syscall_filter::SyscallFilterErrc;

using ::testing::HasSubstr;
using ::testing::StrictMock;

class SyscallFilterTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  std::shared_ptr<StrictMock<LinuxLibcMock>> libc_ =
      std::make_shared<StrictMock<LinuxLibcMock>>();
  std::shared_ptr<StrictMock<SandboxLibraryMock>> sandbox_ =
      std::make_shared<StrictMock<SandboxLibraryMock>>();
};

/**
 * @given a Linux platform
 * @when an installer is selected
 * @then it is the seccomp one, and no native call is made yet
 */
TEST_F(SyscallFilterTest, SelectsSeccompOnLinux) {
  PlatformInfo platform{OsFamily::kLinux, "Linux", "x86_64"};
  EXPECT_OUTCOME_TRUE(installer, selectInstaller(platform, libc_, sandbox_));
  EXPECT_NE(dynamic_cast<SeccompInstaller *>(installer.get()), nullptr);
}

/**
 * @given a macOS platform
 * @when an installer is selected
 * @then it is the seatbelt one
 */
TEST_F(SyscallFilterTest, SelectsSeatbeltOnMacOs) {
  PlatformInfo platform{OsFamily::kMacOs, "Darwin", "arm64"};
  EXPECT_OUTCOME_TRUE(installer, selectInstaller(platform, libc_, sandbox_));
  EXPECT_NE(dynamic_cast<SeatbeltInstaller *>(installer.get()), nullptr);
}

/**
 * @given any other operating system
 * @when an installer is selected
 * @then it fails naming the OS, without touching native libraries
 */
TEST_F(SyscallFilterTest, RejectsOtherOs) {
  PlatformInfo platform{OsFamily::kOther, "FreeBSD", "amd64"};
  EXPECT_OUTCOME_FALSE(err, selectInstaller(platform, libc_, sandbox_));
  EXPECT_EQ(err.code, SyscallFilterErrc::kUnsupportedPlatform);
  EXPECT_THAT(err.message(), HasSubstr("'FreeBSD'"));
}

/**
 * @given an unsupported OS
 * @when the filter is installed twice
 * @then both attempts fail as unsupported, a failure never marks the filter
 * installed
 */
TEST_F(SyscallFilterTest, FailureDoesNotMarkInstalled) {
  PlatformInfo platform{OsFamily::kOther, "Windows", "x86_64"};
  for (auto attempt = 0; attempt < 2; ++attempt) {
    EXPECT_OUTCOME_FALSE(err, installSyscallFilter(platform, "/tmp"));
    EXPECT_EQ(err.code, SyscallFilterErrc::kUnsupportedPlatform);
  }
}
