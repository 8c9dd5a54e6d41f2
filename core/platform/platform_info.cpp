/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "platform/platform_info.hpp"

#include <sys/utsname.h>

namespace execlock::platform {

  OsFamily osFamilyFromName(std::string_view os_name) {
    if (os_name == "Linux") {
      return OsFamily::kLinux;
    }
    if (os_name == "Darwin") {
      return OsFamily::kMacOs;
    }
    return OsFamily::kOther;
  }

  PlatformInfo PlatformInfo::current() {
    struct utsname name {};
    if (::uname(&name) == -1) {
      return PlatformInfo{
          .os = OsFamily::kOther, .os_name = "unknown", .arch = "unknown"};
    }
    return PlatformInfo{
        .os = osFamilyFromName(name.sysname),
        .os_name = name.sysname,
        .arch = name.machine,
    };
  }

}  // namespace execlock::platform
