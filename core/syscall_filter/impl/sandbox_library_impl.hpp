/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "syscall_filter/sandbox_library.hpp"

#include <memory>

namespace execlock::syscall_filter {

  class SandboxLibraryImpl final : public SandboxLibrary {
   public:
    using SandboxInitFn = int (*)(const char *, uint64_t, char **);
    using SandboxFreeErrorFn = void (*)(char *);

    /**
     * Resolves the entry points in libSystem, available since Leopard.
     * @return nullptr when they are missing, e.g. on Linux
     */
    static std::shared_ptr<SandboxLibraryImpl> load();

    SandboxLibraryImpl(SandboxInitFn sandbox_init,
                       SandboxFreeErrorFn sandbox_free_error)
        : sandbox_init_{sandbox_init},
          sandbox_free_error_{sandbox_free_error} {}

    int sandboxInit(const char *profile,
                    uint64_t flags,
                    char **errorbuf) override;

    void sandboxFreeError(char *errorbuf) override;

   private:
    SandboxInitFn sandbox_init_;
    SandboxFreeErrorFn sandbox_free_error_;
  };

}  // namespace execlock::syscall_filter
