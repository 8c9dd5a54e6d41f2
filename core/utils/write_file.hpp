/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

#include <boost/filesystem/operations.hpp>
#include <qtils/outcome.hpp>

namespace execlock {
  /// errno of a failed call, io_error if the call did not set it
  inline std::errc lastErrc() {
    return errno != 0 ? std::errc{errno} : std::errc::io_error;
  }

  inline outcome::result<void> writeFile(const std::filesystem::path &path,
                                         std::string_view data) {
    errno = 0;
    std::ofstream file{path, std::ios::binary};
    if (file and file.write(data.data(), data.size()) and file.flush()) {
      return outcome::success();
    }
    return lastErrc();
  }

  /**
   * Creates a new empty file in `dir` with a name generated from `model`,
   * every '%' of which is replaced by a random hex digit.
   * The file is created exclusively, an existing file is never reused.
   */
  inline outcome::result<std::filesystem::path> createUniqueFile(
      const std::filesystem::path &dir, std::string_view model) {
    constexpr size_t kMaxAttempts = 16;
    for (size_t attempt = 0; attempt < kMaxAttempts; ++attempt) {
      boost::system::error_code ec;
      auto path = boost::filesystem::unique_path(
          boost::filesystem::path{dir.native()} / std::string{model}, ec);
      if (ec) {
        return ec;
      }
      auto fd =
          ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
      if (fd != -1) {
        ::close(fd);
        return std::filesystem::path{path.native()};
      }
      if (errno != EEXIST) {
        return lastErrc();
      }
    }
    return std::errc::file_exists;
  }
}  // namespace execlock
