/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "syscall_filter/syscall_filter_error.hpp"

#include <fmt/format.h>

namespace execlock::syscall_filter {

  std::string describeErrno(int os_error) {
    return std::generic_category().message(os_error);
  }

  std::string SyscallFilterError::message() const {
    auto result = make_error_code(code).message();
    if (not stage.empty()) {
      result = fmt::format("{}: {}", stage, result);
    }
    if (os_error != 0) {
      result = fmt::format(
          "{}: {} (errno {})", result, describeErrno(os_error), os_error);
    }
    if (not detail.empty()) {
      result = fmt::format("{}: {}", result, detail);
    }
    return result;
  }

}  // namespace execlock::syscall_filter
