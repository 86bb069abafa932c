/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

namespace keel::log {
  using soralog::Level;

  using Logger = qtils::SharedRef<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP, WRONG_LOGGER };
  Q_ENUM_ERROR_CODE(Error) {
    using E = decltype(e);
    switch (e) {
      case E::WRONG_LEVEL:
        return "Unknown level";
      case E::WRONG_GROUP:
        return "Unknown group";
      case E::WRONG_LOGGER:
        return "Unknown logger";
    }
    abort();
  }

  outcome::result<Level> str2lvl(std::string_view str);

  inline static std::string defaultGroupName{"keel"};

  class LoggingSystem {
   public:
    explicit LoggingSystem(
        std::shared_ptr<soralog::LoggingSystem> logging_system);

    LoggingSystem(const LoggingSystem &) = delete;
    LoggingSystem &operator=(const LoggingSystem &) = delete;

    /**
     * Applies `-l` command line chunks.
     * A bare level (`debug`) applies to the default group, `group=level`
     * applies to the named group.
     * @return error for the first chunk that cannot be applied
     */
    outcome::result<void> tuneLoggingSystem(
        const std::vector<std::string> &cfg);

    [[nodiscard]]  //
    auto
    getLogger(const std::string &logger_name,
              const std::string &group_name) const {
      return logging_system_->getLogger(logger_name, group_name);
    }

    [[nodiscard]] bool setLevelOfGroup(const std::string &group_name,
                                       Level level) const {
      return logging_system_->setLevelOfGroup(group_name, level);
    }

    [[nodiscard]] bool resetLevelOfGroup(const std::string &group_name) const {
      return logging_system_->resetLevelOfGroup(group_name);
    }

    auto &getSoralog() const {
      return logging_system_;
    }

   private:
    std::shared_ptr<soralog::LoggingSystem> logging_system_;
  };

}  // namespace keel::log
