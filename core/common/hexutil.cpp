/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <algorithm>
#include <boost/algorithm/hex.hpp>
#include <iterator>

OUTCOME_CPP_DEFINE_CATEGORY(ic::common, UnhexError, e) {
  using ic::common::UnhexError;
  switch (e) {
    case UnhexError::kNotEnoughInput:
      return "Input contains odd number of characters";
    case UnhexError::kNonHexInput:
      return "Input contains non-hex characters";
  }
  return "Unknown error";
}

namespace ic::common {
  std::string hex_upper(BytesIn bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex(bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  std::string hex_lower(BytesIn bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  outcome::result<Bytes> unhex(std::string_view hex) {
    Bytes blob;
    blob.reserve((hex.size() + 1) / 2);

    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(blob));
      return blob;
    } catch (const boost::algorithm::not_enough_input &e) {
      return UnhexError::kNotEnoughInput;
    } catch (const boost::algorithm::non_hex_input &e) {
      return UnhexError::kNonHexInput;
    }
  }
}  // namespace ic::common
