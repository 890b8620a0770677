/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ic::codec::json {
  enum class JsonError {
    kParseError = 1,
    kKeyNotFound,
    kWrongType,
    kOutOfRange,
    kFormatError,
  };
}  // namespace ic::codec::json

OUTCOME_HPP_DECLARE_ERROR(ic::codec::json, JsonError);
