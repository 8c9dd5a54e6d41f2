/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace execlock::syscall_filter {

  /// `SANDBOX_NAMED`, the only flag sandbox_init() supports
  constexpr uint64_t kSandboxNamed = 1;

  /**
   * macOS sandbox(7) ("Seatbelt") entry points
   */
  class SandboxLibrary {
   public:
    virtual ~SandboxLibrary() = default;

    /**
     * sandbox_init(3)
     * On failure returns non-zero and stores a message allocated by the OS
     * to `errorbuf`, which must be released with sandboxFreeError()
     */
    virtual int sandboxInit(const char *profile,
                            uint64_t flags,
                            char **errorbuf) = 0;

    /// sandbox_free_error(3)
    virtual void sandboxFreeError(char *errorbuf) = 0;
  };

}  // namespace execlock::syscall_filter
