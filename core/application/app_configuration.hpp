/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace execlock::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return directory for transient files, e.g. the macOS sandbox profile
     */
    virtual const std::filesystem::path &tmpDir() const = 0;

    /**
     * @return whether fork/exec should be denied to the process at startup
     */
    virtual bool syscallFilterEnabled() const = 0;

    /**
     * @return whether a failed syscall filter installation stops startup
     */
    virtual bool syscallFilterEnforced() const = 0;

    /**
     * @return whether to check after startup that fork/exec are denied
     */
    virtual bool probeSpawning() const = 0;

    /**
     * @return log levels, a bare level or `group=level` each
     */
    virtual const std::vector<std::string> &log() const = 0;

    /**
     * @return YAML file to configure logging from
     */
    virtual const std::optional<std::filesystem::path> &logConfigFile()
        const = 0;
  };

}  // namespace execlock::application
