/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "syscall_filter/impl/sandbox_library_impl.hpp"

#include <dlfcn.h>

#include "log/logger.hpp"

namespace execlock::syscall_filter {

  std::shared_ptr<SandboxLibraryImpl> SandboxLibraryImpl::load() {
    auto sandbox_init = ::dlsym(RTLD_DEFAULT, "sandbox_init");
    auto sandbox_free_error = ::dlsym(RTLD_DEFAULT, "sandbox_free_error");
    if (sandbox_init == nullptr or sandbox_free_error == nullptr) {
      auto logger = log::createLogger("SandboxLibrary", "syscall_filter");
      const char *reason = ::dlerror();
      SL_WARN(logger,
              "unable to link sandbox library. native methods (seatbelt) "
              "will be disabled: {}",
              reason != nullptr ? reason : "symbol not found");
      return nullptr;
    }
    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    return std::make_shared<SandboxLibraryImpl>(
        reinterpret_cast<SandboxInitFn>(sandbox_init),
        reinterpret_cast<SandboxFreeErrorFn>(sandbox_free_error));
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
  }

  int SandboxLibraryImpl::sandboxInit(const char *profile,
                                      uint64_t flags,
                                      char **errorbuf) {
    return sandbox_init_(profile, flags, errorbuf);
  }

  void SandboxLibraryImpl::sandboxFreeError(char *errorbuf) {
    sandbox_free_error_(errorbuf);
  }

}  // namespace execlock::syscall_filter
