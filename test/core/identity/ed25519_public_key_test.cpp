/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identity/ed25519_public_key.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

namespace ic::identity {
  using crypto::ed25519::Ed25519Error;

  class Ed25519PublicKeyTest : public ::testing::Test {
   protected:
    Bytes raw_key{
        "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"_unhex};
    Bytes der_key{
        "302a300506032b6570032100d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"_unhex};
  };

  /**
   * @given Raw key
   * @when Create public key
   * @then DER form is prefix followed by raw key
   */
  TEST_F(Ed25519PublicKeyTest, FromRaw) {
    EXPECT_OUTCOME_TRUE(key, Ed25519PublicKey::fromRaw(raw_key));
    EXPECT_EQ(key.toRaw(), raw_key);
    EXPECT_EQ(key.toDer(), der_key);
    EXPECT_EQ(key.toDer().size(), Ed25519PublicKey::kDerKeyLength);
  }

  /**
   * @given DER key
   * @when Create public key
   * @then Raw key is extracted and DER form is kept
   */
  TEST_F(Ed25519PublicKeyTest, FromDer) {
    EXPECT_OUTCOME_TRUE(key, Ed25519PublicKey::fromDer(der_key));
    EXPECT_EQ(key.toRaw(), raw_key);
    EXPECT_EQ(key.toDer(), der_key);
    EXPECT_OUTCOME_EQ(Ed25519PublicKey::fromRaw(raw_key), key);
  }

  /**
   * @given Raw key of wrong length
   * @when Create public key
   * @then Key length error
   */
  TEST_F(Ed25519PublicKeyTest, FromRawWrongLength) {
    raw_key.pop_back();
    EXPECT_OUTCOME_ERROR(Ed25519Error::kInvalidKeyLength,
                         Ed25519PublicKey::fromRaw(raw_key));
    EXPECT_OUTCOME_ERROR(Ed25519Error::kInvalidKeyLength,
                         Ed25519PublicKey::fromRaw(Bytes{}));
  }

  /**
   * @given DER key of wrong length or with wrong prefix
   * @when Create public key
   * @then Certificate errors
   */
  TEST_F(Ed25519PublicKeyTest, FromDerErrors) {
    EXPECT_OUTCOME_ERROR(Ed25519Error::kInvalidCertificateLength,
                         Ed25519PublicKey::fromDer(raw_key));
    der_key.push_back(0);
    EXPECT_OUTCOME_ERROR(Ed25519Error::kInvalidCertificateLength,
                         Ed25519PublicKey::fromDer(der_key));
    der_key.pop_back();
    der_key[8] = 0x71;
    EXPECT_OUTCOME_ERROR(Ed25519Error::kCertificatePrefixMismatch,
                         Ed25519PublicKey::fromDer(der_key));
  }

  /**
   * @given Public key behind interface
   * @when Re-wrap it
   * @then Same key
   */
  TEST_F(Ed25519PublicKeyTest, FromInterface) {
    EXPECT_OUTCOME_TRUE(key, Ed25519PublicKey::fromRaw(raw_key));
    const PublicKey &public_key{key};
    EXPECT_OUTCOME_EQ(Ed25519PublicKey::from(public_key), key);
  }

  /**
   * @given Different raw keys
   * @when Compare
   * @then Not equal
   */
  TEST_F(Ed25519PublicKeyTest, Compare) {
    EXPECT_OUTCOME_TRUE(key1, Ed25519PublicKey::fromRaw(raw_key));
    raw_key[0] ^= 1;
    EXPECT_OUTCOME_TRUE(key2, Ed25519PublicKey::fromRaw(raw_key));
    EXPECT_NE(key1, key2);
  }
}  // namespace ic::identity
