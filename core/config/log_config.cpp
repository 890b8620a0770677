/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/log_config.hpp"

#include "common/logger.hpp"

namespace ic::config {
  spdlog::level::level_enum getLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
      default:
        break;
    }
    return spdlog::level::info;
  }

  options_description configLogging() {
    options_description optionsDescription("Logging options");
    optionsDescription.add_options()(
        "log,l",
        boost::program_options::value<char>()->default_value('i')->notifier(
            [](char level) { common::setLogLevel(getLogLevel(level)); }),
        "log level, [e,w,i,d,t]");
    return optionsDescription;
  }
}  // namespace ic::config
