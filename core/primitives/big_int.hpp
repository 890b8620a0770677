/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include "codec/cbor/cbor_common.hpp"
#include "codec/cbor/cbor_errors.hpp"
#include "common/bytes.hpp"

namespace ic::primitives {
  using BigInt = boost::multiprecision::cpp_int;
}  // namespace ic::primitives

namespace boost::multiprecision {
  /**
   * Always encoded as bignum: tag 2 for zero and positive values, tag 3 with
   * plain magnitude (not `-1 - n`) for negative values. Zero has empty
   * magnitude.
   */
  CBOR_ENCODE(cpp_int, big_int) {
    using namespace ic::codec::cbor;
    ic::Bytes bytes;
    if (big_int != 0) {
      const cpp_int magnitude{abs(big_int)};
      export_bits(magnitude, std::back_inserter(bytes), 8);
    }
    s.tag(big_int < 0 ? kTagNegativeBignum : kTagPositiveBignum);
    return s << bytes;
  }

  /// Accepts plain integers and both bignum tags
  CBOR_DECODE(cpp_int, big_int) {
    using namespace ic::codec::cbor;
    if (s.isInt()) {
      const auto [negative, argument]{s.intArgument()};
      big_int = argument;
      if (negative) {
        big_int = -1 - big_int;
      }
      return s;
    }
    const auto tag{s.tag()};
    if (tag != kTagPositiveBignum && tag != kTagNegativeBignum) {
      ic::outcome::raise(CborDecodeError::kWrongType);
    }
    ic::Bytes bytes;
    s >> bytes;
    if (bytes.empty()) {
      big_int = 0;
    } else {
      import_bits(big_int, bytes.begin(), bytes.end());
    }
    if (tag == kTagNegativeBignum) {
      big_int = -big_int;
    }
    return s;
  }
}  // namespace boost::multiprecision
