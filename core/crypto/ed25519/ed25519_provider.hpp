/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "crypto/ed25519/ed25519_types.hpp"

namespace ic::crypto::ed25519 {

  /**
   * Ed25519 signature scheme, secret keys in NaCl layout (seed followed by
   * public key)
   */
  class Ed25519Provider {
   public:
    virtual ~Ed25519Provider() = default;

    /**
     * @brief Generate key pair from secure random seed
     * @return Ed25519 key pair or error code
     */
    virtual outcome::result<KeyPair> generate() const = 0;

    /**
     * @brief Deterministically generate key pair
     * @param seed - 32 bytes
     * @return Ed25519 key pair or Ed25519Error::kInvalidSeedLength
     */
    virtual outcome::result<KeyPair> generateFromSeed(BytesIn seed) const = 0;

    /**
     * @brief Generate public key from secret key
     * @param secret_key - 64 bytes secret key or 32 bytes seed
     * @return Derived public key or error code
     */
    virtual outcome::result<PublicKey> derive(BytesIn secret_key) const = 0;

    /**
     * @brief Create detached signature for a message
     * @param message - data to signing
     * @param secret_key - 64 bytes secret key or 32 bytes seed
     * @return Ed25519 signature or error code
     */
    virtual outcome::result<Signature> sign(BytesIn message,
                                            BytesIn secret_key) const = 0;

    /**
     * @brief Verify detached signature for a message
     * @param message - signed data
     * @param signature - target for verifying
     * @param public_key - raw public key
     * @return Result of the verification or error code
     */
    virtual outcome::result<bool> verify(BytesIn message,
                                         BytesIn signature,
                                         BytesIn public_key) const = 0;
  };

}  // namespace ic::crypto::ed25519
