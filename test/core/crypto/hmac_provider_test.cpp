/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hmac/impl/hmac_provider_impl.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

namespace ic::crypto::hmac {
  Bytes textBytes(std::string_view text) {
    return {text.begin(), text.end()};
  }

  class HmacProviderTest : public ::testing::Test {
   protected:
    HmacProviderImpl provider;
  };

  /**
   * @given RFC 4231 test case 2
   * @when Compute HMAC-SHA-512
   * @then Code matches test vector
   */
  TEST_F(HmacProviderTest, Rfc4231) {
    EXPECT_OUTCOME_TRUE(
        code,
        provider.hmacSha512(textBytes("Jefe"),
                            textBytes("what do ya want for nothing?")));
    EXPECT_EQ(
        BytesIn{code},
        "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea2505549758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737"_unhex);
  }

  /**
   * @given SLIP-0010 test vector 1 seed for ed25519 curve
   * @when Compute master key code
   * @then Master secret key and chain code match test vector
   */
  TEST_F(HmacProviderTest, Slip0010Master) {
    EXPECT_OUTCOME_TRUE(
        code,
        provider.hmacSha512(textBytes("ed25519 seed"),
                            "000102030405060708090a0b0c0d0e0f"_unhex));
    EXPECT_EQ(
        BytesIn{code}.first(32),
        "2b4be7f19ee27bbf30c667b642d5f4aa69fd169872f8fc3059c08ebae2eb19e7"_unhex);
    EXPECT_EQ(
        BytesIn{code}.subspan(32),
        "90046a93de5380a72b5e45010748567d5ea02bbf6522f979e05c0d8d8ca9fffb"_unhex);
  }

  /**
   * @given Empty key and message
   * @when Compute HMAC-SHA-512
   * @then Code is computed
   */
  TEST_F(HmacProviderTest, Empty) {
    EXPECT_OUTCOME_TRUE_1(provider.hmacSha512({}, {}));
  }
}  // namespace ic::crypto::hmac
