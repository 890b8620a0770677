/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/ed25519/ed25519_error.hpp"
#include "crypto/ed25519/ed25519_types.hpp"
#include "identity/sign_identity.hpp"

namespace ic::identity {
  /**
   * Ed25519 public key, DER form is fixed 12 bytes prefix followed by raw key
   */
  class Ed25519PublicKey : public PublicKey {
   public:
    static constexpr size_t kRawKeyLength{crypto::ed25519::kPublicKeyLength};
    /// SEQUENCE, SEQUENCE, OBJECT Ed25519 OID, BIT STRING without padding
    static constexpr BytesN<12> kDerPrefix{
        0x30, 0x2a, 0x30, 0x05, 0x06, 0x03, 0x2b, 0x65, 0x70, 0x03, 0x21, 0x00};
    static constexpr size_t kDerKeyLength{kDerPrefix.size() + kRawKeyLength};

    /// Re-wraps key through its DER form
    static outcome::result<Ed25519PublicKey> from(const PublicKey &key);

    /**
     * @param raw_key - 32 bytes
     * @return key or Ed25519Error::kInvalidKeyLength
     */
    static outcome::result<Ed25519PublicKey> fromRaw(BytesIn raw_key);

    /**
     * @param der_key - 44 bytes DER-encoded key
     * @return key, Ed25519Error::kInvalidCertificateLength or
     * Ed25519Error::kCertificatePrefixMismatch
     */
    static outcome::result<Ed25519PublicKey> fromDer(BytesIn der_key);

    Bytes toDer() const override;

    const Bytes &toRaw() const;

    bool operator==(const Ed25519PublicKey &other) const;

   private:
    Ed25519PublicKey(Bytes raw_key, Bytes der_key);

    static outcome::result<Bytes> derEncode(BytesIn raw_key);

    Bytes raw_key_;
    Bytes der_key_;
  };
  IC_OPERATOR_NOT_EQUAL(Ed25519PublicKey)
}  // namespace ic::identity
