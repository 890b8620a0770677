/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ic::codec::cbor {
  enum class CborEncodeError {
    kNoEncoderForType = 1,
    kExpectedMapValueSingle,
  };

  enum class CborDecodeError {
    kInvalidCbor = 1,
    kWrongType,
    kIntOverflow,
  };
}  // namespace ic::codec::cbor

OUTCOME_HPP_DECLARE_ERROR(ic::codec::cbor, CborEncodeError);
OUTCOME_HPP_DECLARE_ERROR(ic::codec::cbor, CborDecodeError);
