/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/syscall_filter_bootstrap.hpp"

#include <cerrno>
#include <optional>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mock/core/application/app_configuration_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using execlock::application::AppConfigurationMock;
using execlock::application::SyscallFilterBootstrap;
using execlock::syscall_filter::SyscallFilterErrc;
using execlock::syscall_filter::SyscallFilterError;
using execlock::syscall_filter::SyscallFilterOutcome;

using ::testing::Return;
using ::testing::ReturnRef;

class SyscallFilterBootstrapTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ON_CALL(config_, tmpDir()).WillByDefault(ReturnRef(tmp_dir_));
    ON_CALL(config_, syscallFilterEnabled()).WillByDefault(Return(true));
    ON_CALL(config_, syscallFilterEnforced()).WillByDefault(Return(false));
  }

 protected:
  /// Installer counting its calls and failing with `result` if given
  SyscallFilterBootstrap::Install installer(
      std::optional<SyscallFilterErrc> result = std::nullopt) {
    return [this, result](const std::filesystem::path &tmp_dir)
               -> SyscallFilterOutcome<void> {
      ++calls_;
      seen_tmp_dir_ = tmp_dir;
      if (result) {
        return SyscallFilterError{*result, "test", EPERM};
      }
      return outcome::success();
    };
  }

  std::filesystem::path tmp_dir_{"/var/tmp/execlock"};
  std::filesystem::path seen_tmp_dir_;
  size_t calls_ = 0;
  testing::NiceMock<AppConfigurationMock> config_;
};

/**
 * @given the filter disabled in configuration
 * @when the bootstrap runs
 * @then nothing is installed and startup proceeds
 */
TEST_F(SyscallFilterBootstrapTest, Disabled) {
  EXPECT_CALL(config_, syscallFilterEnabled()).WillRepeatedly(Return(false));
  SyscallFilterBootstrap bootstrap{installer()};

  EXPECT_OUTCOME_TRUE_1(bootstrap.initialize(config_));
  EXPECT_EQ(calls_, 0u);
  EXPECT_FALSE(bootstrap.installed());
}

/**
 * @given the filter enabled
 * @when installation succeeds
 * @then the configured directory was used and the filter is installed
 */
TEST_F(SyscallFilterBootstrapTest, Installs) {
  SyscallFilterBootstrap bootstrap{installer()};

  EXPECT_OUTCOME_TRUE_1(bootstrap.initialize(config_));
  EXPECT_EQ(calls_, 1u);
  EXPECT_EQ(seen_tmp_dir_.native(), tmp_dir_.native());
  EXPECT_TRUE(bootstrap.installed());
}

/**
 * @given the filter enabled but not enforced
 * @when installation fails
 * @then startup proceeds without the filter
 */
TEST_F(SyscallFilterBootstrapTest, FailureTolerated) {
  SyscallFilterBootstrap bootstrap{
      installer(SyscallFilterErrc::kKernelTooOld)};

  EXPECT_OUTCOME_TRUE_1(bootstrap.initialize(config_));
  EXPECT_EQ(calls_, 1u);
  EXPECT_FALSE(bootstrap.installed());
}

/**
 * @given the filter enabled and enforced
 * @when installation fails
 * @then the failure is returned unchanged
 */
TEST_F(SyscallFilterBootstrapTest, FailureEnforced) {
  EXPECT_CALL(config_, syscallFilterEnforced()).WillRepeatedly(Return(true));
  SyscallFilterBootstrap bootstrap{
      installer(SyscallFilterErrc::kUnsupportedPlatform)};

  EXPECT_OUTCOME_FALSE(err, bootstrap.initialize(config_));
  EXPECT_EQ(err.code, SyscallFilterErrc::kUnsupportedPlatform);
  EXPECT_EQ(err.os_error, EPERM);
  EXPECT_FALSE(bootstrap.installed());
}

/**
 * @given the filter already installed by this bootstrap
 * @when the bootstrap runs again
 * @then it fails fast without calling the installer
 */
TEST_F(SyscallFilterBootstrapTest, SecondRunRejected) {
  SyscallFilterBootstrap bootstrap{installer()};
  EXPECT_OUTCOME_TRUE_1(bootstrap.initialize(config_));

  EXPECT_OUTCOME_FALSE(err, bootstrap.initialize(config_));
  EXPECT_EQ(err.code, SyscallFilterErrc::kAlreadyInstalled);
  EXPECT_EQ(calls_, 1u);
  EXPECT_TRUE(bootstrap.installed());
}
