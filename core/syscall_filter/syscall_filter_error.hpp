/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <qtils/enum_error_code.hpp>

#include "outcome/custom.hpp"

namespace execlock::syscall_filter {

  enum class SyscallFilterErrc : uint8_t {
    kUnsupportedPlatform = 1,
    kUnsupportedArchitecture,
    kBridgeUnavailable,
    kKernelTooOld,
    kFeatureNotCompiled,
    kVerificationFailed,
    kPolicyRejected,
    kUnknownError,
    kAlreadyInstalled,
    kProfileWriteFailed,
  };
  Q_ENUM_ERROR_CODE(SyscallFilterErrc) {
    using E = decltype(e);
    switch (e) {
      case E::kUnsupportedPlatform:
        return "syscall filtering not supported for OS";
      case E::kUnsupportedArchitecture:
        return "seccomp unavailable: architecture unsupported";
      case E::kBridgeUnavailable:
        return "could not link native methods";
      case E::kKernelTooOld:
        return "seccomp unavailable: requires kernel 3.5+ with "
               "CONFIG_SECCOMP and CONFIG_SECCOMP_FILTER compiled in";
      case E::kFeatureNotCompiled:
        return "seccomp unavailable: CONFIG_SECCOMP and "
               "CONFIG_SECCOMP_FILTER are needed";
      case E::kVerificationFailed:
        return "seccomp filter installation did not really succeed";
      case E::kPolicyRejected:
        return "sandbox profile rejected";
      case E::kUnknownError:
        return "unexpected error";
      case E::kAlreadyInstalled:
        return "syscall filter is already installed";
      case E::kProfileWriteFailed:
        return "failed to write sandbox profile";
    }
    abort();
  }

  /**
   * Terminal failure of a syscall filter installation attempt.
   * Carries the native call (stage) that failed and the raw OS error, so that
   * the caller can log a precise diagnostic.
   */
  struct SyscallFilterError {
    SyscallFilterError(SyscallFilterErrc code,
                       std::string stage,
                       int os_error = 0,
                       std::string detail = {})
        : code{code},
          stage{std::move(stage)},
          os_error{os_error},
          detail{std::move(detail)} {}

    std::string message() const;

    SyscallFilterErrc code;
    // native call or step that failed, e.g. "prctl(PR_GET_SECCOMP)"
    std::string stage;
    // errno, 0 when the failure is not caused by a native call
    int os_error;
    // platform name, OS diagnostic or previous errors
    std::string detail;
  };

  inline auto make_exception_ptr(SyscallFilterError e) {
    return std::make_exception_ptr(std::runtime_error{e.message()});
  }

  template <typename R>
  using SyscallFilterOutcome = CustomOutcome<R, SyscallFilterError>;

  inline auto format_as(const SyscallFilterError &e) {
    return e.message();
  }

  /// Describes errno the way strerror(3) does
  std::string describeErrno(int os_error);

}  // namespace execlock::syscall_filter
