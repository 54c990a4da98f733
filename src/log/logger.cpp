/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(taiko::log, Error, e) {
  using E = taiko::log::Error;
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

namespace taiko::log {

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
    outcome::result<void> result = outcome::success();
    auto fail = [&](Error error) {
      if (not result.has_error()) {
        result = error;
      }
    };

    for (std::string_view chunk : cfg) {
      auto eq = chunk.find('=');
      if (eq == std::string_view::npos) {
        auto level = str2lvl(chunk);
        if (level.has_error()) {
          fail(Error::WRONG_LEVEL);
          continue;
        }
        logging_system_->setLevelOfGroup(defaultGroupName, level.value());
        continue;
      }

      std::string group_name{chunk.substr(0, eq)};
      if (not logging_system_->getGroup(group_name)) {
        fail(Error::WRONG_GROUP);
        continue;
      }
      auto level = str2lvl(chunk.substr(eq + 1));
      if (level.has_error()) {
        fail(Error::WRONG_LEVEL);
        continue;
      }
      logging_system_->setLevelOfGroup(group_name, level.value());
    }
    return result;
  }

}  // namespace taiko::log
