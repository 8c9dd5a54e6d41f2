/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace execlock::platform {

  enum class OsFamily : uint8_t { kLinux, kMacOs, kOther };

  /**
   * Operating system and CPU architecture of the running process, as reported
   * by the kernel rather than fixed at compile time
   */
  struct PlatformInfo {
    OsFamily os;
    // kernel name, e.g. "Linux", "Darwin", "FreeBSD"
    std::string os_name;
    // machine hardware name, e.g. "x86_64", "aarch64"
    std::string arch;

    static PlatformInfo current();

    bool isX86_64() const {
      return arch == "x86_64" or arch == "amd64";
    }
  };

  OsFamily osFamilyFromName(std::string_view os_name);

}  // namespace execlock::platform
