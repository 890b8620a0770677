/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options.hpp>
#include <spdlog/common.h>

namespace ic::config {
  using boost::program_options::options_description;

  /**
   * Maps single letter level [e,w,i,d,t] to spdlog level, info by default.
   */
  spdlog::level::level_enum getLogLevel(char level);

  /**
   * Creates program option description for 'log' and applies chosen level to
   * library loggers.
   *
   * @return logging program option description
   */
  options_description configLogging();
}  // namespace ic::config
