/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>
#include <tuple>

OUTCOME_CPP_DEFINE_CATEGORY(filetx::log, Error, e) {
  using E = filetx::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_LOGGER:
      return "Unknown logger";
  }
  return "Unknown log::Error";
}

namespace filetx::log {

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::tuneLoggingSystem(
      const std::vector<std::string> &cfg) {
    outcome::result<void> first_problem = outcome::success();
    auto remember = [&](Error error) {
      if (first_problem.has_value()) {
        first_problem = error;
      }
    };

    for (const auto &chunk : cfg) {
      if (auto res = str2lvl(chunk); res.has_value()) {
        std::ignore = logging_system_->setLevelOfGroup(defaultGroupName,
                                                       res.value());
        continue;
      }

      auto eq = chunk.find('=');
      if (eq == std::string::npos) {
        std::cerr << "Invalid logging filter: " << chunk << '\n';
        remember(Error::WRONG_LEVEL);
        continue;
      }

      std::string group_name = chunk.substr(0, eq);
      if (not logging_system_->getGroup(group_name)) {
        std::cerr << "Unknown group: " << group_name << '\n';
        remember(Error::WRONG_GROUP);
        continue;
      }

      std::string level_string = chunk.substr(eq + 1);
      auto res = str2lvl(level_string);
      if (not res.has_value()) {
        std::cerr << "Invalid level '" << level_string << "' for group '"
                  << group_name << "'\n";
        remember(Error::WRONG_LEVEL);
        continue;
      }

      std::ignore = logging_system_->setLevelOfGroup(group_name, res.value());
    }

    return first_problem;
  }

}  // namespace filetx::log
