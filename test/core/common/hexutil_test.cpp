/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>
#include "testutil/outcome.hpp"

using ic::Bytes;
using ic::common::hex_lower;
using ic::common::hex_upper;
using ic::common::unhex;
using ic::common::UnhexError;

/**
 * @given Bytes
 * @when Convert to hex
 * @then Both cases are produced
 */
TEST(Hexutil, Hex) {
  const Bytes bytes{0x00, 0x2a, 0xca, 0xfe};
  EXPECT_EQ(hex_lower(bytes), "002acafe");
  EXPECT_EQ(hex_upper(bytes), "002ACAFE");
  EXPECT_EQ(hex_lower(Bytes{}), "");
}

/**
 * @given Hex of either case
 * @when Unhex
 * @then Bytes are restored
 */
TEST(Hexutil, Unhex) {
  EXPECT_OUTCOME_EQ(unhex("002aCAFE"), (Bytes{0x00, 0x2a, 0xca, 0xfe}));
  EXPECT_OUTCOME_EQ(unhex(""), Bytes{});
}

/**
 * @given Odd length or non hex input
 * @when Unhex
 * @then Error
 */
TEST(Hexutil, UnhexErrors) {
  EXPECT_OUTCOME_ERROR(UnhexError::kNotEnoughInput, unhex("abc"));
  EXPECT_OUTCOME_ERROR(UnhexError::kNonHexInput, unhex("zz"));
}
