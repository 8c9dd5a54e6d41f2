/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "platform/platform_info.hpp"

#include <gtest/gtest.h>

using execlock::platform::OsFamily;
using execlock::platform::osFamilyFromName;
using execlock::platform::PlatformInfo;

/**
 * @given kernel names
 * @when they are classified
 * @then only Linux and Darwin are recognized, exactly
 */
TEST(PlatformInfoTest, OsFamilyFromName) {
  EXPECT_EQ(osFamilyFromName("Linux"), OsFamily::kLinux);
  EXPECT_EQ(osFamilyFromName("Darwin"), OsFamily::kMacOs);
  EXPECT_EQ(osFamilyFromName("FreeBSD"), OsFamily::kOther);
  EXPECT_EQ(osFamilyFromName("Windows"), OsFamily::kOther);
  EXPECT_EQ(osFamilyFromName("linux"), OsFamily::kOther);
  EXPECT_EQ(osFamilyFromName(""), OsFamily::kOther);
}

/**
 * @given machine names
 * @when checked for x86_64
 * @then both spellings of the 64-bit x86 architecture match
 */
TEST(PlatformInfoTest, X86_64) {
  auto on = [](std::string arch) {
    return PlatformInfo{OsFamily::kLinux, "Linux", std::move(arch)};
  };
  EXPECT_TRUE(on("x86_64").isX86_64());
  EXPECT_TRUE(on("amd64").isX86_64());
  EXPECT_FALSE(on("i686").isX86_64());
  EXPECT_FALSE(on("aarch64").isX86_64());
  EXPECT_FALSE(on("arm64").isX86_64());
}

/**
 * @given the running process
 * @when the platform is queried
 * @then it matches the build target
 */
TEST(PlatformInfoTest, Current) {
  auto platform = PlatformInfo::current();
  EXPECT_FALSE(platform.os_name.empty());
  EXPECT_FALSE(platform.arch.empty());
  EXPECT_EQ(platform.os, osFamilyFromName(platform.os_name));
#if defined(__linux__)
  EXPECT_EQ(platform.os, OsFamily::kLinux);
#elif defined(__APPLE__)
  EXPECT_EQ(platform.os, OsFamily::kMacOs);
#endif
}
