/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/log_config.hpp"

#include <gtest/gtest.h>
#include "common/logger.hpp"

namespace ic::config {
  namespace po = boost::program_options;

  /**
   * @given Level letters
   * @when Map to spdlog levels
   * @then Unknown letters are info
   */
  TEST(LogConfig, Levels) {
    EXPECT_EQ(getLogLevel('e'), spdlog::level::err);
    EXPECT_EQ(getLogLevel('w'), spdlog::level::warn);
    EXPECT_EQ(getLogLevel('i'), spdlog::level::info);
    EXPECT_EQ(getLogLevel('d'), spdlog::level::debug);
    EXPECT_EQ(getLogLevel('t'), spdlog::level::trace);
    EXPECT_EQ(getLogLevel('x'), spdlog::level::info);
  }

  /**
   * @given Command line with log option
   * @when Parse and notify options
   * @then Existing and new loggers use chosen level
   */
  TEST(LogConfig, Option) {
    const auto existing{common::createLogger("log_config_test")};
    const char *argv[]{"test", "--log", "d"};
    po::variables_map vm;
    po::store(po::parse_command_line(3, argv, configLogging()), vm);
    po::notify(vm);
    EXPECT_EQ(vm["log"].as<char>(), 'd');
    EXPECT_EQ(existing->level(), spdlog::level::debug);
    EXPECT_EQ(common::createLogger("log_config_test_new")->level(),
              spdlog::level::debug);

    po::variables_map defaults;
    po::store(po::parse_command_line(1, argv, configLogging()), defaults);
    po::notify(defaults);
    EXPECT_EQ(common::createLogger("log_config_test")->level(),
              spdlog::level::info);
  }
}  // namespace ic::config
