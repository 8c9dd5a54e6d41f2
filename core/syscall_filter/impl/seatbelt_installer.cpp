/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "syscall_filter/impl/seatbelt_installer.hpp"

#include <fmt/format.h>
#include <libp2p/common/final_action.hpp>

#include "utils/write_file.hpp"

namespace execlock::syscall_filter {

  SeatbeltInstaller::SeatbeltInstaller(std::shared_ptr<SandboxLibrary> sandbox,
                                       std::string rules)
      : sandbox_{std::move(sandbox)},
        rules_{std::move(rules)},
        log_{log::createLogger("Seatbelt", "syscall_filter")} {}

  SyscallFilterOutcome<void> SeatbeltInstaller::install(
      const std::filesystem::path &tmp_dir) {
    // could be some really ancient OS X (< Leopard)
    if (sandbox_ == nullptr) {
      return SyscallFilterError{SyscallFilterErrc::kBridgeUnavailable,
                                "sandbox_init",
                                0,
                                "requires Leopard or above"};
    }

    auto created = createUniqueFile(tmp_dir, "execlock-%%%%-%%%%-%%%%.sb");
    if (not created) {
      return SyscallFilterError{SyscallFilterErrc::kProfileWriteFailed,
                                "create profile",
                                0,
                                fmt::format("{}: {}",
                                            tmp_dir.native(),
                                            created.error().message())};
    }
    auto profile = std::filesystem::absolute(created.value());

    bool removed = false;
    // best effort, must not replace the first failure
    libp2p::common::FinalAction remove_on_failure{[&] {
      if (not removed) {
        std::error_code ignored;
        std::filesystem::remove(profile, ignored);
      }
    }};

    if (auto res = writeFile(profile, rules_ + "\n"); not res) {
      return SyscallFilterError{
          SyscallFilterErrc::kProfileWriteFailed,
          "write profile",
          0,
          fmt::format("{}: {}", profile.native(), res.error().message())};
    }

    if (auto res = initProfile(profile); not res) {
      return res;
    }

    removed = true;
    std::error_code ec;
    if (not std::filesystem::remove(profile, ec)) {
      return SyscallFilterError{
          SyscallFilterErrc::kProfileWriteFailed,
          "remove profile",
          ec.value(),
          fmt::format("{}: {}",
                      profile.native(),
                      ec ? ec.message() : "no such file")};
    }
    return outcome::success();
  }

  SyscallFilterOutcome<void> SeatbeltInstaller::initProfile(
      const std::filesystem::path &path) {
    char *errorbuf = nullptr;
    if (sandbox_->sandboxInit(path.c_str(), kSandboxNamed, &errorbuf) != 0) {
      // keep the message from the OS, e.g. a syntax error
      std::string diagnostic =
          errorbuf != nullptr ? errorbuf : "no diagnostic provided";
      if (errorbuf != nullptr) {
        sandbox_->sandboxFreeError(errorbuf);
      }
      return SyscallFilterError{SyscallFilterErrc::kPolicyRejected,
                                "sandbox_init",
                                0,
                                std::move(diagnostic)};
    }
    SL_DEBUG(log_, "OS X seatbelt initialization successful");
    return outcome::success();
  }

}  // namespace execlock::syscall_filter
