/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/throw_exception.hpp>
#include <libp2p/outcome/outcome.hpp>

/**
 * OUTCOME_TRYA assigns value of result to existing variable or returns error.
 */
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_TRYA(var, val, ...) \
  OUTCOME_TRY(var, __VA_ARGS__);     \
  val = std::move(var);
#define OUTCOME_TRYA(val, ...) \
  _OUTCOME_TRYA(BOOST_OUTCOME_TRY_UNIQUE_NAME, val, __VA_ARGS__)

namespace ic::outcome {
  using libp2p::outcome::failure;
  using libp2p::outcome::result;
  using libp2p::outcome::success;

  /**
   * @brief throws outcome::result error as boost exception
   * @param t error code
   */
  [[noreturn]] inline void raise(const std::error_code &ec) {
    boost::throw_exception(std::system_error(ec));
  }

  /**
   * @brief throws outcome::result error as boost exception
   * @tparam T enum error type
   * @param t error value
   */
  template <typename T,
            typename = std::enable_if_t<std::is_error_code_enum_v<T>>>
  [[noreturn]] inline void raise(T t) {
    raise(make_error_code(t));
  }

  /**
   * Runs `f` and converts error code raised as `std::system_error` back into
   * failed result.
   */
  template <typename F>
  result<std::invoke_result_t<F>> catchRaised(const F &f) {
    try {
      return success(f());
    } catch (std::system_error &e) {
      return failure(e.code());
    }
  }
}  // namespace ic::outcome
