/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/ed25519/ed25519_provider.hpp"

namespace ic::crypto::ed25519 {

  /**
   * OpenSSL EVP implementation of Ed25519 provider
   */
  class Ed25519ProviderImpl : public Ed25519Provider {
   public:
    outcome::result<KeyPair> generate() const override;

    outcome::result<KeyPair> generateFromSeed(BytesIn seed) const override;

    outcome::result<PublicKey> derive(BytesIn secret_key) const override;

    outcome::result<Signature> sign(BytesIn message,
                                    BytesIn secret_key) const override;

    outcome::result<bool> verify(BytesIn message,
                                 BytesIn signature,
                                 BytesIn public_key) const override;
  };

}  // namespace ic::crypto::ed25519
