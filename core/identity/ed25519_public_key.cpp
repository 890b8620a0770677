/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identity/ed25519_public_key.hpp"

namespace ic::identity {
  using crypto::ed25519::Ed25519Error;

  outcome::result<Ed25519PublicKey> Ed25519PublicKey::from(
      const PublicKey &key) {
    return fromDer(key.toDer());
  }

  outcome::result<Ed25519PublicKey> Ed25519PublicKey::fromRaw(
      BytesIn raw_key) {
    OUTCOME_TRY(der_key, derEncode(raw_key));
    return Ed25519PublicKey{copy(raw_key), std::move(der_key)};
  }

  outcome::result<Ed25519PublicKey> Ed25519PublicKey::fromDer(
      BytesIn der_key) {
    if (static_cast<size_t>(der_key.size()) != kDerKeyLength) {
      return Ed25519Error::kInvalidCertificateLength;
    }
    auto raw_key{der_key.subspan(kDerPrefix.size())};
    OUTCOME_TRY(expected, derEncode(raw_key));
    if (expected != der_key) {
      return Ed25519Error::kCertificatePrefixMismatch;
    }
    return Ed25519PublicKey{copy(raw_key), std::move(expected)};
  }

  Bytes Ed25519PublicKey::toDer() const {
    return der_key_;
  }

  const Bytes &Ed25519PublicKey::toRaw() const {
    return raw_key_;
  }

  bool Ed25519PublicKey::operator==(const Ed25519PublicKey &other) const {
    return raw_key_ == other.raw_key_;
  }

  Ed25519PublicKey::Ed25519PublicKey(Bytes raw_key, Bytes der_key)
      : raw_key_{std::move(raw_key)}, der_key_{std::move(der_key)} {}

  outcome::result<Bytes> Ed25519PublicKey::derEncode(BytesIn raw_key) {
    if (static_cast<size_t>(raw_key.size()) != kRawKeyLength) {
      return Ed25519Error::kInvalidKeyLength;
    }
    Bytes der_key{kDerPrefix.begin(), kDerPrefix.end()};
    append(der_key, raw_key);
    return der_key;
  }
}  // namespace ic::identity
