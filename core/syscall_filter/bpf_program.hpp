/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace execlock::syscall_filter {

  // classic BPF opcode parts, see linux/bpf_common.h
  constexpr uint16_t kBpfLd = 0x00;
  constexpr uint16_t kBpfW = 0x00;
  constexpr uint16_t kBpfAbs = 0x20;
  constexpr uint16_t kBpfJmp = 0x05;
  constexpr uint16_t kBpfJeq = 0x10;
  constexpr uint16_t kBpfJgt = 0x20;
  constexpr uint16_t kBpfJge = 0x30;
  constexpr uint16_t kBpfRet = 0x06;
  constexpr uint16_t kBpfK = 0x00;

  // BPF_MAXINSNS
  constexpr size_t kBpfMaxInstructions = 4096;

  /// Size of `struct sock_filter`
  constexpr size_t kBpfInstructionSize = 8;

  /**
   * One instruction of the classic BPF machine, mirrors `struct sock_filter`
   */
  struct BpfInstruction {
    uint16_t code;
    // number of instructions to skip if the condition holds
    uint8_t jt;
    // number of instructions to skip otherwise
    uint8_t jf;
    uint32_t k;

    bool operator==(const BpfInstruction &) const = default;
  };

  constexpr BpfInstruction bpfStmt(uint16_t code, uint32_t k) {
    return BpfInstruction{.code = code, .jt = 0, .jf = 0, .k = k};
  }

  constexpr BpfInstruction bpfJump(uint16_t code,
                                   uint32_t k,
                                   uint8_t jt,
                                   uint8_t jf) {
    return BpfInstruction{.code = code, .jt = jt, .jf = jf, .k = k};
  }

  /**
   * Mirrors `struct sock_fprog`, the argument of seccomp(2) and
   * prctl(PR_SET_SECCOMP)
   */
  struct SockFprog {
    unsigned short len;
    const void *filter;
  };

  /**
   * BPF program serialized into the byte layout the kernel reads:
   * `code(2) | jt(1) | jf(1) | k(4)` per instruction, in native byte order.
   */
  class EncodedBpfProgram {
   public:
    static EncodedBpfProgram encode(std::span<const BpfInstruction> program);

    const std::vector<uint8_t> &bytes() const {
      return bytes_;
    }

    size_t instructionCount() const {
      return bytes_.size() / kBpfInstructionSize;
    }

    /// Header pointing into this object, valid while it is alive and unmoved
    SockFprog fprog() const {
      return SockFprog{
          .len = static_cast<unsigned short>(instructionCount()),
          .filter = bytes_.data(),
      };
    }

   private:
    explicit EncodedBpfProgram(std::vector<uint8_t> bytes)
        : bytes_{std::move(bytes)} {}

    std::vector<uint8_t> bytes_;
  };

}  // namespace execlock::syscall_filter
