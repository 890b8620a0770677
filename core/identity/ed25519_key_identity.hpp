/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "common/logger.hpp"
#include "crypto/ed25519/ed25519_provider.hpp"
#include "crypto/hmac/hmac_provider.hpp"
#include "identity/ed25519_public_key.hpp"
#include "identity/identity_error.hpp"

namespace ic::identity {
  using crypto::ed25519::Ed25519Provider;
  using crypto::hmac::HmacProvider;

  /// HMAC key of SLIP-0010 master key derivation for Ed25519
  constexpr std::string_view kSlip0010Key{"ed25519 seed"};

  /**
   * Copy of identity keys
   */
  struct Ed25519KeyPair {
    Ed25519PublicKey public_key;
    Bytes secret_key;
  };

  /**
   * Identity signing with Ed25519 key
   */
  class Ed25519KeyIdentity : public SignIdentity {
   public:
    /**
     * @brief Creates identity from random key, or from seed deterministically
     * @param seed - optional 32 bytes seed
     * @return identity or Ed25519Error
     */
    static outcome::result<Ed25519KeyIdentity> generate(
        std::shared_ptr<const Ed25519Provider> ed25519,
        boost::optional<BytesIn> seed = boost::none);

    static outcome::result<Ed25519KeyIdentity> generate(
        boost::optional<BytesIn> seed = boost::none);

    /**
     * @brief Derives identity according to SLIP-0010, first half of
     * HMAC-SHA-512 keyed with "ed25519 seed" is used as key seed
     * @param seed - seed of any length
     * @return identity or IdentityError::kKeyDerivationFailure
     */
    static outcome::result<Ed25519KeyIdentity> fromSeedWithSlip0010(
        BytesIn seed,
        const HmacProvider &hmac,
        std::shared_ptr<const Ed25519Provider> ed25519);

    static outcome::result<Ed25519KeyIdentity> fromSeedWithSlip0010(
        BytesIn seed);

    /**
     * @brief Creates identity from raw keys, pair consistency is not checked
     * @param public_key - raw 32 bytes public key
     * @param secret_key - secret key
     */
    static outcome::result<Ed25519KeyIdentity> fromKeyPair(BytesIn public_key,
                                                           BytesIn secret_key);

    /**
     * @brief Restores identity. Accepted shapes are `[derHex, secretHex]`,
     * `{publicKey: {data}, secretKey: {data}}` with raw public key, and
     * `{_publicKey: {data}, _privateKey: {data}}` with DER public key, where
     * `data` is byte array.
     * @param json - JSON text
     * @return identity or IdentityError::kDeserializationError
     */
    static outcome::result<Ed25519KeyIdentity> fromJSON(std::string_view json);

    /// Returns `["<der public key hex>","<secret key hex>"]`
    std::string toJSON() const;

    const PublicKey &getPublicKey() const override;

    /// Returns copy of keys
    Ed25519KeyPair getKeyPair() const;

    outcome::result<Bytes> sign(BytesIn blob) const override;

    /// Verifies signature with own public key
    outcome::result<bool> verify(BytesIn blob, BytesIn signature) const;

   private:
    Ed25519KeyIdentity(Ed25519PublicKey public_key,
                       Bytes secret_key,
                       std::shared_ptr<const Ed25519Provider> ed25519);

    Ed25519PublicKey public_key_;
    Bytes secret_key_;
    std::shared_ptr<const Ed25519Provider> ed25519_;
  };
}  // namespace ic::identity
