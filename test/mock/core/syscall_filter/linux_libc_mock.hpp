/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "syscall_filter/linux_libc.hpp"

namespace execlock::syscall_filter {

  class LinuxLibcMock : public LinuxLibc {
   public:
    MOCK_METHOD(int,
                prctl,
                (int, unsigned long, unsigned long, unsigned long, unsigned long),
                (override));

    MOCK_METHOD(long,
                syscall,
                (long, unsigned long, unsigned long, unsigned long),
                (override));

    MOCK_METHOD(int, lastError, (), (const, override));
  };

}  // namespace execlock::syscall_filter
