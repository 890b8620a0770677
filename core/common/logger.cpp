/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ic::common {
  namespace {
    std::mutex &loggersMutex() {
      static std::mutex mutex;
      return mutex;
    }

    spdlog::level::level_enum &defaultLevel() {
      static spdlog::level::level_enum level{spdlog::level::info};
      return level;
    }

    spdlog::sink_ptr &consoleSink() {
      static spdlog::sink_ptr sink{
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
      return sink;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    std::lock_guard lock{loggersMutex()};
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      logger = std::make_shared<spdlog::logger>(tag, consoleSink());
      logger->set_level(defaultLevel());
      spdlog::register_logger(logger);
    }
    return logger;
  }

  void setLogLevel(spdlog::level::level_enum level) {
    std::lock_guard lock{loggersMutex()};
    defaultLevel() = level;
    spdlog::set_level(level);
  }
}  // namespace ic::common
