/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <type_traits>

#include "log/logger.hpp"

#ifdef DECLARE_PROPERTY
#error DECLARE_PROPERTY already defined!
#endif  // DECLARE_PROPERTY
#define DECLARE_PROPERTY(T, N)                                                 \
 private:                                                                      \
  T N##_;                                                                      \
                                                                               \
 public:                                                                       \
  std::conditional<std::is_trivial<T>::value && (sizeof(T) <= sizeof(size_t)), \
                   T,                                                          \
                   const T &>::type                                            \
  N() const override {                                                         \
    return N##_;                                                               \
  }

namespace execlock::application {

  // clang-format off
  /**
   * Reads app configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *          DEFAULT VALUES              <- low priority
   */
  // clang-format on

  class AppConfigurationImpl final : public AppConfiguration {
   public:
    AppConfigurationImpl();
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    AppConfigurationImpl(AppConfigurationImpl &&) = default;
    AppConfigurationImpl &operator=(AppConfigurationImpl &&) = default;

    /**
     * @return false if the arguments are invalid or help was requested, the
     * reason is already printed
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    /// Usage was printed on request, startup should stop without failure
    bool helpRequested() const {
      return helpRequested_;
    }

    DECLARE_PROPERTY(std::filesystem::path, tmpDir);
    DECLARE_PROPERTY(bool, syscallFilterEnabled);
    DECLARE_PROPERTY(bool, syscallFilterEnforced);
    DECLARE_PROPERTY(bool, probeSpawning);
    DECLARE_PROPERTY(std::vector<std::string>, log);
    DECLARE_PROPERTY(std::optional<std::filesystem::path>, logConfigFile);

   private:
    bool validate_config() const;

    bool helpRequested_;

    log::Logger logger_;
  };

}  // namespace execlock::application

#undef DECLARE_PROPERTY
