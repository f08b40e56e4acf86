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

#include "utils/ctor_limiters.hpp"

namespace filetx::log {
  using soralog::Level;

  using Logger = qtils::SharedRef<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP, WRONG_LOGGER };

  outcome::result<Level> str2lvl(std::string_view str);

  inline static std::string defaultGroupName{"filetx"};

  /**
   * Owns the soralog logging system of the process and hands out loggers.
   * Only one instance may exist at a time.
   */
  class LoggingSystem : public Singleton<LoggingSystem> {
   public:
    explicit LoggingSystem(
        std::shared_ptr<soralog::LoggingSystem> logging_system);

    /**
     * Apply `--log` CLI chunks.
     * Each chunk is either a bare level (applied to the default group) or
     * `<group>=<level>`. Bad chunks are reported and skipped.
     * @return the first problem met, if any
     */
    outcome::result<void> tuneLoggingSystem(
        const std::vector<std::string> &cfg);

    [[nodiscard]] auto getLogger(const std::string &logger_name,
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

}  // namespace filetx::log

OUTCOME_HPP_DECLARE_ERROR(filetx::log, Error);
