/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "syscall_filter/bpf_program.hpp"

#include <cstring>

#include <boost/assert.hpp>

namespace execlock::syscall_filter {

  namespace {
    template <typename T>
    uint8_t *put(uint8_t *out, T value) {
      std::memcpy(out, &value, sizeof(value));
      return out + sizeof(value);
    }
  }  // namespace

  EncodedBpfProgram EncodedBpfProgram::encode(
      std::span<const BpfInstruction> program) {
    BOOST_ASSERT(program.size() <= kBpfMaxInstructions);
    // struct layout is not relied upon, fields are packed one by one
    std::vector<uint8_t> bytes(program.size() * kBpfInstructionSize);
    auto *out = bytes.data();
    for (auto &insn : program) {
      out = put(out, insn.code);
      out = put(out, insn.jt);
      out = put(out, insn.jf);
      out = put(out, insn.k);
    }
    return EncodedBpfProgram{std::move(bytes)};
  }

}  // namespace execlock::syscall_filter
