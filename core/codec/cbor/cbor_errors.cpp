/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ic::codec::cbor, CborEncodeError, e) {
  using ic::codec::cbor::CborEncodeError;
  switch (e) {
    case CborEncodeError::kNoEncoderForType:
      return "CBOR encode: no encoder matches value type";
    case CborEncodeError::kExpectedMapValueSingle:
      return "CBOR encode: map value must be exactly one item";
  }
  return "CBOR encode: unknown error";
}

OUTCOME_CPP_DEFINE_CATEGORY(ic::codec::cbor, CborDecodeError, e) {
  using ic::codec::cbor::CborDecodeError;
  switch (e) {
    case CborDecodeError::kInvalidCbor:
      return "CBOR decode: malformed or truncated input";
    case CborDecodeError::kWrongType:
      return "CBOR decode: unexpected item type";
    case CborDecodeError::kIntOverflow:
      return "CBOR decode: integer out of range";
  }
  return "CBOR decode: unknown error";
}
