/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "common/cmp.hpp"

namespace ic::crypto::ed25519 {
  constexpr size_t kSeedLength = 32;
  constexpr size_t kPublicKeyLength = 32;
  constexpr size_t kSecretKeyLength = 64;
  constexpr size_t kSignatureLength = 64;

  using Seed = BytesN<kSeedLength>;
  using PublicKey = BytesN<kPublicKeyLength>;
  /**
   * Seed followed by public key
   */
  using SecretKey = BytesN<kSecretKeyLength>;
  using Signature = BytesN<kSignatureLength>;

  /**
   * @struct Key pair
   */
  struct KeyPair {
    SecretKey secret_key; /**< Ed25519 seed and public key */
    PublicKey public_key; /**< Ed25519 raw public key */

    bool operator==(const KeyPair &other) const {
      return secret_key == other.secret_key && public_key == other.public_key;
    }
  };
  IC_OPERATOR_NOT_EQUAL(KeyPair)
}  // namespace ic::crypto::ed25519
