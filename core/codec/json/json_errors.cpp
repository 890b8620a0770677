/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ic::codec::json, JsonError, e) {
  using E = ic::codec::json::JsonError;
  switch (e) {
    case E::kParseError:
      return "JSON parse error";
    case E::kKeyNotFound:
      return "JSON key not found";
    case E::kWrongType:
      return "wrong JSON type";
    case E::kOutOfRange:
      return "JSON number out of range";
    case E::kFormatError:
      return "JSON format error";
  }

  return "unknown JsonError error code";
}
